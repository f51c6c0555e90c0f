#pragma once

#include "etfcast/core/context.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/wire/cursor.hpp"
#include "etfcast/wire/tags.hpp"
#include "etfcast/wire/term.hpp"

namespace etfcast::wire {
    using etfcast::core::DecodeContext;
    using etfcast::core::Status;

    enum class DecodeMode : u8 {
        Materialize = 0,
        DeferRaw = 1,   // capture the exact bytes of the subtree as a RawSpan
    };

    // Consumes the leading version byte (131).
    [[nodiscard]] Status read_version(ByteCursor& cur, DecodeContext& ctx);

    [[nodiscard]] Status read_tag(ByteCursor& cur, u8* tag, DecodeContext& ctx);

    // Reads a tag, then the term it introduces.
    [[nodiscard]] Status decode_term(ByteCursor& cur, DecodeMode mode, Term* out, DecodeContext& ctx);

    // Same as decode_term for a tag already consumed from `cur`.
    [[nodiscard]] Status decode_term_tagged(ByteCursor& cur, u8 tag, DecodeMode mode, Term* out, DecodeContext& ctx);

    // Materialises a map key; Binary keys come back as Text.
    [[nodiscard]] Status decode_map_key(ByteCursor& cur, Term* out, DecodeContext& ctx);

    // Walks the term introduced by `tag` without building it.
    [[nodiscard]] Status skip_term_tagged(ByteCursor& cur, u8 tag, DecodeContext& ctx);

    // Element count of an `l` or `j` list; `j` yields 0 and has no tail.
    [[nodiscard]] Status read_list_header(ByteCursor& cur, u8 tag, u32* count, DecodeContext& ctx);

    // Consumes the `j` tail of an `l` list when the configuration expects one.
    [[nodiscard]] Status read_list_tail(ByteCursor& cur, DecodeContext& ctx);

    // Pair count of a `t` map.
    [[nodiscard]] Status read_map_header(ByteCursor& cur, u32* count, DecodeContext& ctx);

} // namespace etfcast::wire
