#pragma once

#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "etfcast/cast/pointer_target.hpp"
#include "etfcast/cast/raw.hpp"
#include "etfcast/cast/record.hpp"
#include "etfcast/cast/shape.hpp"
#include "etfcast/core/context.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/wire/cursor.hpp"
#include "etfcast/wire/decoder.hpp"
#include "etfcast/wire/term.hpp"

namespace etfcast::cast {
    using etfcast::core::DecodeContext;
    using etfcast::core::Status;

    // Assigns an already decoded term to *out.
    template <typename T>
    [[nodiscard]] Status cast_term(const wire::Term& term, T* out, DecodeContext& ctx);

    // Reads one term from `cur` into *out. Lists, maps and records are streamed
    // straight into typed destinations; RawData destinations at any depth
    // capture the exact bytes of their subtree.
    template <typename T>
    [[nodiscard]] Status decode_into(wire::ByteCursor& cur, T* out, DecodeContext& ctx);

    namespace detail {
        using etfcast::core::PathScope;
        using etfcast::core::StatusCode;
        using etfcast::core::is_ok;
        using etfcast::core::ok_status;
        using wire::TermKind;

        template <typename Leaf>
        Status mismatch(const wire::Term& term, DecodeContext& ctx) {
            constexpr TargetShape shape = shape_of<Leaf>();
            std::string msg = "cannot cast ";
            msg += wire::term_kind_name(term.kind());
            msg += " into ";
            msg += shape_name(shape);
            return ctx.fail_cast(StatusCode::TypeMismatch, static_cast<u32>(term.kind()),
                                 wire::term_kind_name(term.kind()), shape_name(shape), msg);
        }

        template <typename Leaf>
        Status null_target(DecodeContext& ctx) {
            return ctx.fail_cast(StatusCode::NotWritable, 0, nullptr, shape_name(shape_of<Leaf>()),
                                 "destination pointer is null");
        }

        // Starting value of a record: the current one when it is reachable
        // without allocating, else a default one.
        template <typename T>
        typename PointerTarget<T>::leaf_type seed_record(const PointerTarget<T>& target) {
            using Leaf = typename PointerTarget<T>::leaf_type;
            if constexpr (PointerTarget<T>::kDepth == 0 && std::is_copy_constructible_v<Leaf>) {
                return *target.existing_leaf();
            } else {
                return Leaf{};
            }
        }

        // A record being decoded for *out. Move-only records reached without
        // indirection start empty; commit() moves the fields no key wrote over
        // from the current value, so *out changes only on success.
        template <typename T>
        class RecordStage {
        public:
            using Leaf = typename PointerTarget<T>::leaf_type;
            static constexpr bool kCarriesFields =
                PointerTarget<T>::kDepth == 0 && !std::is_copy_constructible_v<Leaf>;

            explicit RecordStage(T* out) : out_(out), value_(seed_record(PointerTarget<T>(out))) {
                if constexpr (kCarriesFields) {
                    seen_.assign(std::tuple_size_v<decltype(RecordFields<Leaf>::fields())>, false);
                }
            }

            [[nodiscard]] Leaf& value() noexcept { return value_; }

            void mark(u32 index) {
                if constexpr (kCarriesFields) {
                    seen_[index] = true;
                }
            }

            void commit() {
                if constexpr (kCarriesFields) {
                    std::apply(
                        [&](const auto&... f) {
                            u32 i = 0;
                            ((seen_[i++] ? (void)0 : (void)(value_.*(f.member) = std::move(out_->*(f.member)))), ...);
                        },
                        RecordFields<Leaf>::fields());
                }
                PointerTarget<T>(out_).assign(std::move(value_));
            }

        private:
            T* out_;
            Leaf value_;
            std::vector<bool> seen_;
        };

        template <typename T>
        Status clear_absent(PointerTarget<T>& target, DecodeContext& ctx) {
            const Status s = target.clear_to_absent();
            if (!is_ok(s)) {
                return ctx.fail_cast(s.code, static_cast<u32>(TermKind::Absent), wire::term_kind_name(TermKind::Absent),
                                     shape_name(PointerTarget<T>::leaf_shape()),
                                     "cannot clear a value without indirection; use an optional or pointer");
            }
            return ok_status();
        }

        template <typename T>
        Status decode_span_into(const wire::Bytes& bytes, T* out, DecodeContext& ctx) {
            wire::ByteCursor cur(core::BufferView{bytes.data(), static_cast<u32>(bytes.size())});
            return decode_into(cur, out, ctx);
        }

        template <typename Leaf, typename Mark>
        Status convert_record(const wire::Term& term, Leaf* staged, DecodeContext& ctx, Mark&& mark) {
            if constexpr (has_decode_hook_v<Leaf>) {
                const Status s = staged->decode_etf(UncastedResult(term));
                if (!is_ok(s)) {
                    return ctx.fail_status(s, wire::term_kind_name(TermKind::Map), shape_name(TargetShape::Record),
                                           "decode hook failed");
                }
                return s;
            } else {
                const FieldTable& table = field_table_for<Leaf>();
                for (const wire::TermPair& entry : term.map()) {
                    if (!entry.key.is(TermKind::Text)) {
                        return ctx.fail_cast(StatusCode::TypeMismatch, static_cast<u32>(entry.key.kind()),
                                             wire::term_kind_name(entry.key.kind()), shape_name(TargetShape::Record),
                                             "record keys must be text");
                    }
                    u32 index = 0;
                    if (!table.find(entry.key.text(), &index)) {
                        continue;
                    }
                    auto scope = PathScope::field(ctx, entry.key.text());
                    const Status s = visit_field(*staged, index, [&](auto& member) {
                        return cast_term(entry.value, &member, ctx);
                    });
                    if (!is_ok(s)) return s;
                    mark(index);
                }
                return ok_status();
            }
        }

        template <typename Leaf>
        Status convert_list(const wire::Term& term, Leaf* staged, DecodeContext& ctx) {
            using Elem = typename Leaf::value_type;
            const wire::TermList& items = term.list();
            Leaf result;
            result.reserve(items.size());
            for (u32 i = 0; i < items.size(); ++i) {
                auto scope = PathScope::index(ctx, i);
                Elem slot{};
                const Status s = cast_term(items[i], &slot, ctx);
                if (!is_ok(s)) return s;
                result.push_back(std::move(slot));
            }
            *staged = std::move(result);
            return ok_status();
        }

        template <typename Leaf>
        Status convert_map(const wire::Term& term, Leaf* staged, DecodeContext& ctx) {
            using Key = typename Leaf::key_type;
            using Value = typename Leaf::mapped_type;
            const wire::TermMap& entries = term.map();
            Leaf result;
            for (u32 i = 0; i < entries.size(); ++i) {
                auto scope = PathScope::entry(ctx, i);
                Key key{};
                Status s = cast_term(entries[i].key, &key, ctx);
                if (!is_ok(s)) return s;
                Value value{};
                s = cast_term(entries[i].value, &value, ctx);
                if (!is_ok(s)) return s;
                result.insert_or_assign(std::move(key), std::move(value));
            }
            *staged = std::move(result);
            return ok_status();
        }

        // Converts a materialised, non-absent, non-raw term into a staged leaf.
        template <typename Leaf>
        Status convert(const wire::Term& term, Leaf* staged, DecodeContext& ctx) {
            constexpr TargetShape shape = shape_of<Leaf>();
            const TermKind kind = term.kind();

            if constexpr (shape == TargetShape::Atom) {
                if (kind == TermKind::Atom) {
                    *staged = wire::Atom(term.atom_name());
                    return ok_status();
                }
                if (kind == TermKind::Boolean) {
                    *staged = wire::Atom(term.boolean_value() ? "true" : "false");
                    return ok_status();
                }
            } else if constexpr (shape == TargetShape::Boolean) {
                if (kind == TermKind::Boolean) {
                    *staged = term.boolean_value();
                    return ok_status();
                }
            } else if constexpr (shape == TargetShape::Integer) {
                if constexpr (accepts_small_integer_v<Leaf>) {
                    if (kind == TermKind::SmallInteger) {
                        *staged = static_cast<Leaf>(term.small_integer_value());
                        return ok_status();
                    }
                }
                if constexpr (accepts_signed_v<Leaf, wire::i32>) {
                    if (kind == TermKind::Integer32) {
                        *staged = static_cast<Leaf>(term.integer32_value());
                        return ok_status();
                    }
                }
                if constexpr (accepts_signed_v<Leaf, wire::i64>) {
                    if (kind == TermKind::Integer64) {
                        *staged = static_cast<Leaf>(term.integer64_value());
                        return ok_status();
                    }
                }
            } else if constexpr (shape == TargetShape::Float) {
                if constexpr (accepts_float64_v<Leaf>) {
                    if (kind == TermKind::Float64) {
                        *staged = static_cast<Leaf>(term.float64_value());
                        return ok_status();
                    }
                }
            } else if constexpr (shape == TargetShape::Text) {
                if (kind == TermKind::Binary) {
                    const wire::Bytes& b = term.bytes();
                    staged->assign(b.begin(), b.end());
                    return ok_status();
                }
                if (kind == TermKind::Text) {
                    *staged = term.text();
                    return ok_status();
                }
            } else if constexpr (shape == TargetShape::Bytes) {
                if (kind == TermKind::Binary) {
                    *staged = term.bytes();
                    return ok_status();
                }
                if (kind == TermKind::List) {
                    return convert_list(term, staged, ctx);
                }
            } else if constexpr (shape == TargetShape::SequenceAny) {
                if (kind == TermKind::List) {
                    *staged = term.list();
                    return ok_status();
                }
            } else if constexpr (shape == TargetShape::Sequence) {
                if (kind == TermKind::List) {
                    return convert_list(term, staged, ctx);
                }
            } else if constexpr (shape == TargetShape::MapAny) {
                if (kind == TermKind::Map) {
                    *staged = term.map();
                    return ok_status();
                }
            } else if constexpr (shape == TargetShape::Map) {
                if (kind == TermKind::Map) {
                    return convert_map(term, staged, ctx);
                }
            } else if constexpr (shape == TargetShape::Record) {
                if (kind == TermKind::Map) {
                    return convert_record(term, staged, ctx, [](u32) {});
                }
            }
            return mismatch<Leaf>(term, ctx);
        }

        template <typename T>
        Status stream_sequence(wire::ByteCursor& cur, wire::u8 tag, T* out, DecodeContext& ctx) {
            using Leaf = typename PointerTarget<T>::leaf_type;
            using Elem = typename Leaf::value_type;

            core::DepthGuard guard(ctx);
            Status s = guard.enter(cur.position() - 1);
            if (!is_ok(s)) return s;
            u32 count = 0;
            s = wire::read_list_header(cur, tag, &count, ctx);
            if (!is_ok(s)) return s;

            Leaf staged;
            staged.reserve(count);
            for (u32 i = 0; i < count; ++i) {
                auto scope = PathScope::index(ctx, i);
                Elem slot{};
                s = decode_into(cur, &slot, ctx);
                if (!is_ok(s)) return s;
                staged.push_back(std::move(slot));
            }
            if (tag == wire::kTagList) {
                s = wire::read_list_tail(cur, ctx);
                if (!is_ok(s)) return s;
            }
            PointerTarget<T>(out).assign(std::move(staged));
            return ok_status();
        }

        template <typename T>
        Status stream_map(wire::ByteCursor& cur, T* out, DecodeContext& ctx) {
            using Leaf = typename PointerTarget<T>::leaf_type;
            using Key = typename Leaf::key_type;
            using Value = typename Leaf::mapped_type;

            core::DepthGuard guard(ctx);
            Status s = guard.enter(cur.position() - 1);
            if (!is_ok(s)) return s;
            u32 count = 0;
            s = wire::read_map_header(cur, &count, ctx);
            if (!is_ok(s)) return s;

            Leaf staged;
            for (u32 i = 0; i < count; ++i) {
                auto scope = PathScope::entry(ctx, i);
                wire::Term key_term;
                s = wire::decode_map_key(cur, &key_term, ctx);
                if (!is_ok(s)) return s;
                Key key{};
                s = cast_term(key_term, &key, ctx);
                if (!is_ok(s)) return s;
                Value value{};
                s = decode_into(cur, &value, ctx);
                if (!is_ok(s)) return s;
                staged.insert_or_assign(std::move(key), std::move(value));
            }
            PointerTarget<T>(out).assign(std::move(staged));
            return ok_status();
        }

        template <typename T>
        Status stream_record(wire::ByteCursor& cur, T* out, DecodeContext& ctx) {
            using Leaf = typename PointerTarget<T>::leaf_type;

            core::DepthGuard guard(ctx);
            Status s = guard.enter(cur.position() - 1);
            if (!is_ok(s)) return s;
            u32 count = 0;
            s = wire::read_map_header(cur, &count, ctx);
            if (!is_ok(s)) return s;

            RecordStage<T> stage(out);
            const FieldTable& table = field_table_for<Leaf>();
            for (u32 i = 0; i < count; ++i) {
                wire::Term key;
                s = wire::decode_map_key(cur, &key, ctx);
                if (!is_ok(s)) return s;
                if (!key.is(TermKind::Text)) {
                    auto scope = PathScope::entry(ctx, i);
                    return ctx.fail_cast(StatusCode::TypeMismatch, static_cast<u32>(key.kind()),
                                         wire::term_kind_name(key.kind()), shape_name(TargetShape::Record),
                                         "record keys must be text");
                }

                u32 index = 0;
                if (!table.find(key.text(), &index)) {
                    wire::u8 value_tag = 0;
                    s = wire::read_tag(cur, &value_tag, ctx);
                    if (!is_ok(s)) return s;
                    s = wire::skip_term_tagged(cur, value_tag, ctx);
                    if (!is_ok(s)) return s;
                    continue;
                }

                auto scope = PathScope::field(ctx, key.text());
                s = visit_field(stage.value(), index, [&](auto& member) { return decode_into(cur, &member, ctx); });
                if (!is_ok(s)) return s;
                stage.mark(index);
            }
            stage.commit();
            return ok_status();
        }
    } // namespace detail

    template <typename T>
    Status cast_term(const wire::Term& term, T* out, DecodeContext& ctx) {
        using Target = PointerTarget<T>;
        using Leaf = typename Target::leaf_type;
        constexpr TargetShape shape = Target::leaf_shape();
        static_assert(shape != TargetShape::Unsupported, "etfcast: unsupported destination type");

        if (out == nullptr) {
            return detail::null_target<Leaf>(ctx);
        }
        Target target(out);

        if constexpr (shape == TargetShape::Opaque) {
            target.assign(term);
            return core::ok_status();
        } else if constexpr (shape == TargetShape::Deferred) {
            target.assign(UncastedResult(term));
            return core::ok_status();
        } else {
            if (term.is(wire::TermKind::RawSpan)) {
                if constexpr (shape == TargetShape::Raw) {
                    target.assign(RawData(term.bytes()));
                    return core::ok_status();
                } else {
                    return detail::decode_span_into(term.bytes(), out, ctx);
                }
            }

            if constexpr (shape == TargetShape::Raw) {
                return ctx.fail_cast(core::StatusCode::TypeMismatch, static_cast<u32>(term.kind()),
                                     wire::term_kind_name(term.kind()), shape_name(shape),
                                     "raw data can only be captured from wire bytes");
            } else {
                if (term.is(wire::TermKind::Absent)) {
                    if constexpr (shape == TargetShape::Atom) {
                        target.assign(wire::Atom("nil"));
                        return core::ok_status();
                    } else {
                        return detail::clear_absent(target, ctx);
                    }
                }

                if constexpr (shape == TargetShape::Record && !has_decode_hook_v<Leaf>) {
                    if (!term.is(wire::TermKind::Map)) {
                        return detail::mismatch<Leaf>(term, ctx);
                    }
                    detail::RecordStage<T> stage(out);
                    const Status s = detail::convert_record(term, &stage.value(), ctx,
                                                            [&](u32 index) { stage.mark(index); });
                    if (!core::is_ok(s)) return s;
                    stage.commit();
                    return core::ok_status();
                }

                Leaf staged{};
                const Status s = detail::convert(term, &staged, ctx);
                if (!core::is_ok(s)) return s;
                target.assign(std::move(staged));
                return core::ok_status();
            }
        }
    }

    template <typename T>
    Status decode_into(wire::ByteCursor& cur, T* out, DecodeContext& ctx) {
        using Target = PointerTarget<T>;
        using Leaf = typename Target::leaf_type;
        constexpr TargetShape shape = Target::leaf_shape();
        static_assert(shape != TargetShape::Unsupported, "etfcast: unsupported destination type");

        if (out == nullptr) {
            return detail::null_target<Leaf>(ctx);
        }

        wire::u8 tag = 0;
        Status s = wire::read_tag(cur, &tag, ctx);
        if (!core::is_ok(s)) return s;

        if constexpr (shape == TargetShape::Raw) {
            const u32 start = cur.position() - 1;
            s = wire::skip_term_tagged(cur, tag, ctx);
            if (!core::is_ok(s)) return s;
            const core::BufferView span = cur.consumed_since(start);
            Target(out).assign(RawData(wire::Bytes(span.data, span.data + span.len)));
            return core::ok_status();
        } else {
            if constexpr (shape == TargetShape::Sequence || shape == TargetShape::Bytes) {
                if (tag == wire::kTagList || tag == wire::kTagNil) {
                    return detail::stream_sequence(cur, tag, out, ctx);
                }
            }
            if constexpr (shape == TargetShape::Map) {
                if (tag == wire::kTagMap) {
                    return detail::stream_map(cur, out, ctx);
                }
            }
            if constexpr (shape == TargetShape::Record && !has_decode_hook_v<Leaf>) {
                if (tag == wire::kTagMap) {
                    return detail::stream_record(cur, out, ctx);
                }
            }

            wire::Term term;
            s = wire::decode_term_tagged(cur, tag, wire::DecodeMode::Materialize, &term, ctx);
            if (!core::is_ok(s)) return s;
            return cast_term(term, out, ctx);
        }
    }

    template <typename T>
    core::Status RawData::cast_into(T* out, const core::DecoderConfig& cfg, core::ErrorDetail* error) const {
        DecodeContext ctx(cfg, error);
        if (bytes_.empty()) {
            return ctx.fail_wire(core::StatusCode::Truncated, 0, "raw data is empty");
        }
        return detail::decode_span_into(bytes_, out, ctx);
    }

    template <typename T>
    core::Status UncastedResult::cast_into(T* out, const core::DecoderConfig& cfg, core::ErrorDetail* error) const {
        DecodeContext ctx(cfg, error);
        return cast_term(term_, out, ctx);
    }

} // namespace etfcast::cast
