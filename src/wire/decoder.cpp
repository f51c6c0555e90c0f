#include "etfcast/wire/decoder.hpp"

#include <bit>
#include <cstdint>
#include <limits>
#include <string>

namespace etfcast::wire {
    namespace {
        using etfcast::core::DepthGuard;
        using etfcast::core::StatusCode;
        using etfcast::core::is_ok;
        using etfcast::core::ok_status;
        using u64 = etfcast::core::u64;

        Status short_read(DecodeContext& ctx, Status s, const char* what) {
            return ctx.fail_wire(s.code, s.aux, what);
        }

        Status read_atom_name(ByteCursor& cur, u8 tag, BufferView* name, DecodeContext& ctx) {
            u32 len = 0;
            if (tag_has_wide_atom_length(tag)) {
                u16 len16 = 0;
                const Status s = cur.read_u16_be(&len16);
                if (!is_ok(s)) return short_read(ctx, s, "atom length missing");
                len = len16;
            } else {
                u8 len8 = 0;
                const Status s = cur.read_byte(&len8);
                if (!is_ok(s)) return short_read(ctx, s, "atom length missing");
                len = len8;
            }
            const Status s = cur.read_exact(len, name);
            if (!is_ok(s)) return short_read(ctx, s, "atom size larger than remainder of input");
            return ok_status();
        }

        Term atom_term(BufferView name) {
            std::string s(reinterpret_cast<const char*>(name.data), name.len);
            if (s == "true") return Term::boolean(true);
            if (s == "false") return Term::boolean(false);
            if (s == "nil") return Term::absent();
            return Term::atom(std::move(s));
        }

        // Little-endian magnitude, byte i weighs 256^i.
        Status read_small_big(ByteCursor& cur, i64* out, DecodeContext& ctx) {
            const u32 at = cur.position();
            u8 n = 0;
            Status s = cur.read_byte(&n);
            if (!is_ok(s)) return short_read(ctx, s, "small big byte count missing");
            u8 sign = 0;
            s = cur.read_byte(&sign);
            if (!is_ok(s)) return short_read(ctx, s, "small big sign missing");
            BufferView digits{};
            s = cur.read_exact(n, &digits);
            if (!is_ok(s)) return short_read(ctx, s, "small big length greater than input");

            u64 magnitude = 0;
            for (u32 i = 0; i < digits.len; ++i) {
                const u8 b = digits.data[i];
                if (i >= 8) {
                    if (b != 0) {
                        return ctx.fail_wire(StatusCode::Overflow, at, "small big does not fit in 64 bits");
                    }
                    continue;
                }
                magnitude |= static_cast<u64>(b) << (8 * i);
            }

            constexpr u64 kMaxPositive = static_cast<u64>(std::numeric_limits<i64>::max());
            if (sign == 0) {
                if (magnitude > kMaxPositive) {
                    return ctx.fail_wire(StatusCode::Overflow, at, "small big does not fit in int64");
                }
                *out = static_cast<i64>(magnitude);
                return ok_status();
            }
            if (magnitude > kMaxPositive + 1) {
                return ctx.fail_wire(StatusCode::Overflow, at, "small big does not fit in int64");
            }
            *out = magnitude == kMaxPositive + 1 ? std::numeric_limits<i64>::min()
                                                 : -static_cast<i64>(magnitude);
            return ok_status();
        }

        Status read_new_float(ByteCursor& cur, double* out, DecodeContext& ctx) {
            BufferView b{};
            const Status s = cur.read_exact(8, &b);
            if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for float");
            u64 bits = 0;
            for (u32 i = 0; i < 8; ++i) {
                bits = (bits << 8) | static_cast<u64>(b.data[i]);
            }
            *out = std::bit_cast<double>(bits);
            return ok_status();
        }

        Status read_binary(ByteCursor& cur, BufferView* out, DecodeContext& ctx) {
            u32 len = 0;
            Status s = cur.read_u32_be(&len);
            if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for binary length");
            s = cur.read_exact(len, out);
            if (!is_ok(s)) return short_read(ctx, s, "binary length is longer than remainder of input");
            return ok_status();
        }

        Status materialize_tagged(ByteCursor& cur, u8 tag, Term* out, DecodeContext& ctx) {
            const u32 at = cur.position() - 1;

            if (tag_is_atom(tag)) {
                BufferView name{};
                const Status s = read_atom_name(cur, tag, &name, ctx);
                if (!is_ok(s)) return s;
                *out = atom_term(name);
                return ok_status();
            }

            switch (tag) {
            case kTagNil:
                *out = Term::list(TermList{});
                return ok_status();
            case kTagList: {
                DepthGuard guard(ctx);
                Status s = guard.enter(at);
                if (!is_ok(s)) return s;
                u32 count = 0;
                s = read_list_header(cur, tag, &count, ctx);
                if (!is_ok(s)) return s;
                TermList items;
                items.reserve(count);
                for (u32 i = 0; i < count; ++i) {
                    auto scope = etfcast::core::PathScope::index(ctx, i);
                    Term item;
                    s = decode_term(cur, DecodeMode::Materialize, &item, ctx);
                    if (!is_ok(s)) return s;
                    items.push_back(std::move(item));
                }
                s = read_list_tail(cur, ctx);
                if (!is_ok(s)) return s;
                *out = Term::list(std::move(items));
                return ok_status();
            }
            case kTagBinary: {
                BufferView b{};
                const Status s = read_binary(cur, &b, ctx);
                if (!is_ok(s)) return s;
                *out = Term::binary(Bytes(b.data, b.data + b.len));
                return ok_status();
            }
            case kTagSmallInteger: {
                u8 v = 0;
                const Status s = cur.read_byte(&v);
                if (!is_ok(s)) return short_read(ctx, s, "failed to read small int");
                *out = Term::small_integer(v);
                return ok_status();
            }
            case kTagInteger: {
                u32 v = 0;
                const Status s = cur.read_u32_be(&v);
                if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for int32");
                *out = Term::integer32(std::bit_cast<i32>(v));
                return ok_status();
            }
            case kTagSmallBig: {
                i64 v = 0;
                const Status s = read_small_big(cur, &v, ctx);
                if (!is_ok(s)) return s;
                *out = Term::integer64(v);
                return ok_status();
            }
            case kTagNewFloat: {
                double v = 0.0;
                const Status s = read_new_float(cur, &v, ctx);
                if (!is_ok(s)) return s;
                *out = Term::float64(v);
                return ok_status();
            }
            case kTagMap: {
                DepthGuard guard(ctx);
                Status s = guard.enter(at);
                if (!is_ok(s)) return s;
                u32 count = 0;
                s = read_map_header(cur, &count, ctx);
                if (!is_ok(s)) return s;
                TermMap entries;
                entries.reserve(count);
                for (u32 i = 0; i < count; ++i) {
                    auto scope = etfcast::core::PathScope::entry(ctx, i);
                    TermPair pair;
                    s = decode_map_key(cur, &pair.key, ctx);
                    if (!is_ok(s)) return s;
                    s = decode_term(cur, DecodeMode::Materialize, &pair.value, ctx);
                    if (!is_ok(s)) return s;
                    entries.push_back(std::move(pair));
                }
                *out = Term::map(std::move(entries));
                return ok_status();
            }
            default:
                return ctx.fail_wire_tag(StatusCode::UnknownTag, at, tag, "unknown data type");
            }
        }
    } // namespace

    Status read_version(ByteCursor& cur, DecodeContext& ctx) {
        u8 v = 0;
        const Status s = cur.read_byte(&v);
        if (!is_ok(s)) {
            return ctx.fail_wire(StatusCode::BadVersion, s.aux, "input is empty");
        }
        if (v != kVersionMagic) {
            return ctx.fail_wire_tag(StatusCode::BadVersion, 0, v, "first byte is not the ETF version 131");
        }
        return ok_status();
    }

    Status read_tag(ByteCursor& cur, u8* tag, DecodeContext& ctx) {
        const Status s = cur.read_byte(tag);
        if (!is_ok(s)) return short_read(ctx, s, "not long enough to include data type");
        return ok_status();
    }

    Status decode_term(ByteCursor& cur, DecodeMode mode, Term* out, DecodeContext& ctx) {
        u8 tag = 0;
        const Status s = read_tag(cur, &tag, ctx);
        if (!is_ok(s)) return s;
        return decode_term_tagged(cur, tag, mode, out, ctx);
    }

    Status decode_term_tagged(ByteCursor& cur, u8 tag, DecodeMode mode, Term* out, DecodeContext& ctx) {
        if (mode == DecodeMode::Materialize) {
            return materialize_tagged(cur, tag, out, ctx);
        }
        const u32 start = cur.position() - 1;
        const Status s = skip_term_tagged(cur, tag, ctx);
        if (!is_ok(s)) return s;
        const BufferView span = cur.consumed_since(start);
        *out = Term::raw_span(Bytes(span.data, span.data + span.len));
        return ok_status();
    }

    Status decode_map_key(ByteCursor& cur, Term* out, DecodeContext& ctx) {
        Term key;
        const Status s = decode_term(cur, DecodeMode::Materialize, &key, ctx);
        if (!is_ok(s)) return s;
        if (key.is(TermKind::Binary)) {
            const Bytes& b = key.bytes();
            *out = Term::text(std::string(b.begin(), b.end()));
            return ok_status();
        }
        *out = std::move(key);
        return ok_status();
    }

    Status skip_term_tagged(ByteCursor& cur, u8 tag, DecodeContext& ctx) {
        const u32 at = cur.position() - 1;

        if (tag_is_atom(tag)) {
            BufferView name{};
            return read_atom_name(cur, tag, &name, ctx);
        }

        BufferView ignored{};
        switch (tag) {
        case kTagNil:
            return ok_status();
        case kTagList: {
            DepthGuard guard(ctx);
            Status s = guard.enter(at);
            if (!is_ok(s)) return s;
            u32 count = 0;
            s = read_list_header(cur, tag, &count, ctx);
            if (!is_ok(s)) return s;
            for (u32 i = 0; i < count; ++i) {
                u8 item_tag = 0;
                s = read_tag(cur, &item_tag, ctx);
                if (!is_ok(s)) return s;
                s = skip_term_tagged(cur, item_tag, ctx);
                if (!is_ok(s)) return s;
            }
            return read_list_tail(cur, ctx);
        }
        case kTagBinary:
            return read_binary(cur, &ignored, ctx);
        case kTagSmallInteger: {
            const Status s = cur.read_exact(1, &ignored);
            if (!is_ok(s)) return short_read(ctx, s, "failed to read small int");
            return ok_status();
        }
        case kTagInteger: {
            const Status s = cur.read_exact(4, &ignored);
            if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for int32");
            return ok_status();
        }
        case kTagSmallBig: {
            u8 n = 0;
            Status s = cur.read_byte(&n);
            if (!is_ok(s)) return short_read(ctx, s, "small big byte count missing");
            s = cur.read_exact(static_cast<u32>(n) + 1, &ignored);
            if (!is_ok(s)) return short_read(ctx, s, "small big length greater than input");
            return ok_status();
        }
        case kTagNewFloat: {
            const Status s = cur.read_exact(8, &ignored);
            if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for float");
            return ok_status();
        }
        case kTagMap: {
            DepthGuard guard(ctx);
            Status s = guard.enter(at);
            if (!is_ok(s)) return s;
            u32 count = 0;
            s = read_map_header(cur, &count, ctx);
            if (!is_ok(s)) return s;
            for (u64 i = 0; i < 2 * static_cast<u64>(count); ++i) {
                u8 item_tag = 0;
                s = read_tag(cur, &item_tag, ctx);
                if (!is_ok(s)) return s;
                s = skip_term_tagged(cur, item_tag, ctx);
                if (!is_ok(s)) return s;
            }
            return ok_status();
        }
        default:
            return ctx.fail_wire_tag(StatusCode::UnknownTag, at, tag, "unknown data type");
        }
    }

    Status read_list_header(ByteCursor& cur, u8 tag, u32* count, DecodeContext& ctx) {
        if (tag == kTagNil) {
            *count = 0;
            return ok_status();
        }
        const u32 at = cur.position();
        const Status s = cur.read_u32_be(count);
        if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for list length");

        // Every element takes at least one byte, the tail one more.
        u64 need = *count;
        if (ctx.config().list_tail == etfcast::core::ListTail::Required) {
            need += 1;
        }
        if (need > cur.remaining()) {
            return ctx.fail_wire(StatusCode::TooLarge, at, "list length exceeds remaining input");
        }
        return ok_status();
    }

    Status read_list_tail(ByteCursor& cur, DecodeContext& ctx) {
        if (ctx.config().list_tail == etfcast::core::ListTail::Omitted) {
            return ok_status();
        }
        const u32 at = cur.position();
        u8 tail = 0;
        const Status s = cur.read_byte(&tail);
        if (!is_ok(s)) return short_read(ctx, s, "list tail missing");
        if (tail != kTagNil) {
            return ctx.fail_wire_tag(StatusCode::Invalid, at, tail, "improper list tail");
        }
        return ok_status();
    }

    Status read_map_header(ByteCursor& cur, u32* count, DecodeContext& ctx) {
        const u32 at = cur.position();
        const Status s = cur.read_u32_be(count);
        if (!is_ok(s)) return short_read(ctx, s, "not enough bytes for map length");

        // Key and value take at least one byte each.
        if (2 * static_cast<u64>(*count) > cur.remaining()) {
            return ctx.fail_wire(StatusCode::TooLarge, at, "map length exceeds remaining input");
        }
        return ok_status();
    }
} // namespace etfcast::wire
