#include "etfcast/etfcast.hpp"

namespace etfcast {
    namespace detail {
        Status open_input(BufferView in, wire::ByteCursor* cur, core::DecodeContext& ctx) {
            if (in.data == nullptr || in.len < 2) {
                return ctx.fail_wire(core::StatusCode::BadVersion, 0, "input shorter than version byte and tag");
            }
            *cur = wire::ByteCursor(in);
            return wire::read_version(*cur, ctx);
        }
    } // namespace detail

    Status unpack_term(BufferView in, wire::Term* out, const DecoderConfig& cfg, ErrorDetail* error) {
        core::DecodeContext ctx(cfg, error);
        if (out == nullptr) {
            return ctx.fail_cast(core::StatusCode::NotWritable, 0, nullptr, nullptr, "invalid pointer");
        }
        wire::ByteCursor cur;
        const Status s = detail::open_input(in, &cur, ctx);
        if (!core::is_ok(s)) return s;
        return wire::decode_term(cur, wire::DecodeMode::Materialize, out, ctx);
    }
} // namespace etfcast
