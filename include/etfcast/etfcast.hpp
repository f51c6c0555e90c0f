#pragma once

#include "etfcast/cast/engine.hpp"
#include "etfcast/cast/raw.hpp"
#include "etfcast/cast/record.hpp"
#include "etfcast/core/config.hpp"
#include "etfcast/core/context.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/wire/cursor.hpp"
#include "etfcast/wire/decoder.hpp"
#include "etfcast/wire/term.hpp"

namespace etfcast {
    using etfcast::cast::RawData;
    using etfcast::cast::UncastedResult;
    using etfcast::core::BufferView;
    using etfcast::core::DecoderConfig;
    using etfcast::core::ErrorDetail;
    using etfcast::core::Status;

    namespace detail {
        // Version byte check shared by unpack() and unpack_term().
        [[nodiscard]] Status open_input(BufferView in, wire::ByteCursor* cur, core::DecodeContext& ctx);
    }

    // Decodes one ETF value (version byte included) into *out. Bytes after the
    // top-level term are ignored. *out is written only on success; `error`
    // receives the first failure.
    template <typename T>
    [[nodiscard]] Status unpack(BufferView in, T* out, const DecoderConfig& cfg = DecoderConfig{},
                                ErrorDetail* error = nullptr) {
        core::DecodeContext ctx(cfg, error);
        if (out == nullptr) {
            return ctx.fail_cast(core::StatusCode::NotWritable, 0, nullptr, nullptr, "invalid pointer");
        }
        wire::ByteCursor cur;
        const Status s = detail::open_input(in, &cur, ctx);
        if (!core::is_ok(s)) return s;
        return cast::decode_into(cur, out, ctx);
    }

    // Dynamic form: the whole value as a Term tree.
    [[nodiscard]] Status unpack_term(BufferView in, wire::Term* out, const DecoderConfig& cfg = DecoderConfig{},
                                     ErrorDetail* error = nullptr);

} // namespace etfcast
