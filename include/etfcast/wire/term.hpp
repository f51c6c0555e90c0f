#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "etfcast/core/types.hpp"

namespace etfcast::wire {
    using u8 = etfcast::core::u8;
    using u32 = etfcast::core::u32;
    using i32 = etfcast::core::i32;
    using i64 = etfcast::core::i64;

    enum class TermKind : u8 {
        Atom = 0,
        Boolean,
        Absent,
        SmallInteger,
        Integer32,
        Integer64,
        Float64,
        Binary,
        Text,       // binary map keys
        List,
        Map,
        RawSpan,    // DeferRaw only; exact wire bytes, tag included
    };

    [[nodiscard]] const char* term_kind_name(TermKind kind) noexcept;

    // Erlang atom. Not interned; the reserved names true/false/nil never reach
    // an Atom term but an Atom destination can still receive them.
    struct Atom {
        std::string name;

        Atom() = default;
        explicit Atom(std::string n) : name(std::move(n)) {}

        friend bool operator==(const Atom&, const Atom&) = default;
        friend auto operator<=>(const Atom&, const Atom&) = default;
    };

    using Bytes = std::vector<u8>;

    class Term;
    struct TermPair;
    using TermList = std::vector<Term>;
    using TermMap = std::vector<TermPair>;

    class Term {
    public:
        Term() noexcept = default;

        [[nodiscard]] static Term atom(std::string name);
        [[nodiscard]] static Term boolean(bool v) noexcept;
        [[nodiscard]] static Term absent() noexcept;
        [[nodiscard]] static Term small_integer(u8 v) noexcept;
        [[nodiscard]] static Term integer32(i32 v) noexcept;
        [[nodiscard]] static Term integer64(i64 v) noexcept;
        [[nodiscard]] static Term float64(double v) noexcept;
        [[nodiscard]] static Term binary(Bytes bytes);
        [[nodiscard]] static Term text(std::string s);
        [[nodiscard]] static Term list(TermList items);
        [[nodiscard]] static Term map(TermMap entries);
        [[nodiscard]] static Term raw_span(Bytes bytes);

        [[nodiscard]] TermKind kind() const noexcept { return kind_; }
        [[nodiscard]] bool is(TermKind k) const noexcept { return kind_ == k; }

        // Accessors assume the matching kind; a mismatch yields a zero/empty value.
        [[nodiscard]] const std::string& atom_name() const noexcept;
        [[nodiscard]] const std::string& text() const noexcept;
        [[nodiscard]] bool boolean_value() const noexcept;
        [[nodiscard]] u8 small_integer_value() const noexcept;
        [[nodiscard]] i32 integer32_value() const noexcept;
        [[nodiscard]] i64 integer64_value() const noexcept;
        [[nodiscard]] double float64_value() const noexcept;
        [[nodiscard]] const Bytes& bytes() const noexcept; // Binary and RawSpan
        [[nodiscard]] const TermList& list() const noexcept;
        [[nodiscard]] const TermMap& map() const noexcept;

        // True when both terms reference the same list/map/byte payload.
        [[nodiscard]] bool shares_payload_with(const Term& other) const noexcept;

        friend bool operator==(const Term& a, const Term& b);

    private:
        using Payload = std::variant<std::monostate,
                                     bool,
                                     u8,
                                     i32,
                                     i64,
                                     double,
                                     std::string,
                                     std::shared_ptr<const Bytes>,
                                     std::shared_ptr<const TermList>,
                                     std::shared_ptr<const TermMap>>;

        Term(TermKind kind, Payload payload) noexcept : kind_(kind), payload_(std::move(payload)) {}

        TermKind kind_{TermKind::Absent};
        Payload payload_{};
    };

    struct TermPair {
        Term key;
        Term value;

        friend bool operator==(const TermPair&, const TermPair&) = default;
    };

    // Erlang-like rendering: [1, foo, <<"bar">>, #{"k" => nil}]
    [[nodiscard]] std::string format_term(const Term& term);

} // namespace etfcast::wire

template <>
struct std::hash<etfcast::wire::Atom> {
    std::size_t operator()(const etfcast::wire::Atom& a) const noexcept {
        return std::hash<std::string>{}(a.name);
    }
};
