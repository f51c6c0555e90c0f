#include "etfcast/wire/term.hpp"

#include <cstdio>

namespace etfcast::wire {
    namespace {
        const std::string& empty_string() noexcept {
            static const std::string s;
            return s;
        }

        const Bytes& empty_bytes() noexcept {
            static const Bytes b;
            return b;
        }

        const TermList& empty_list() noexcept {
            static const TermList l;
            return l;
        }

        const TermMap& empty_map() noexcept {
            static const TermMap m;
            return m;
        }

        bool printable(const Bytes& b) noexcept {
            for (u8 c : b) {
                if (c < 0x20 || c > 0x7e || c == '"' || c == '\\') {
                    return false;
                }
            }
            return true;
        }

        void append_bytes(std::string* out, const Bytes& b) {
            if (printable(b)) {
                out->push_back('"');
                out->append(b.begin(), b.end());
                out->push_back('"');
                return;
            }
            char buf[8];
            for (std::size_t i = 0; i < b.size(); ++i) {
                if (i > 0) {
                    out->push_back(',');
                }
                std::snprintf(buf, sizeof(buf), "%u", static_cast<unsigned>(b[i]));
                out->append(buf);
            }
        }

        void format_into(const Term& t, std::string* out) {
            char buf[40];
            switch (t.kind()) {
            case TermKind::Atom:
                out->append(t.atom_name());
                return;
            case TermKind::Boolean:
                out->append(t.boolean_value() ? "true" : "false");
                return;
            case TermKind::Absent:
                out->append("nil");
                return;
            case TermKind::SmallInteger:
                std::snprintf(buf, sizeof(buf), "%u", static_cast<unsigned>(t.small_integer_value()));
                out->append(buf);
                return;
            case TermKind::Integer32:
                std::snprintf(buf, sizeof(buf), "%ld", static_cast<long>(t.integer32_value()));
                out->append(buf);
                return;
            case TermKind::Integer64:
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(t.integer64_value()));
                out->append(buf);
                return;
            case TermKind::Float64:
                std::snprintf(buf, sizeof(buf), "%.17g", t.float64_value());
                out->append(buf);
                return;
            case TermKind::Binary:
                out->append("<<");
                append_bytes(out, t.bytes());
                out->append(">>");
                return;
            case TermKind::Text:
                out->push_back('"');
                out->append(t.text());
                out->push_back('"');
                return;
            case TermKind::List: {
                out->push_back('[');
                bool first = true;
                for (const Term& item : t.list()) {
                    if (!first) {
                        out->append(", ");
                    }
                    first = false;
                    format_into(item, out);
                }
                out->push_back(']');
                return;
            }
            case TermKind::Map: {
                out->append("#{");
                bool first = true;
                for (const TermPair& e : t.map()) {
                    if (!first) {
                        out->append(", ");
                    }
                    first = false;
                    format_into(e.key, out);
                    out->append(" => ");
                    format_into(e.value, out);
                }
                out->push_back('}');
                return;
            }
            case TermKind::RawSpan:
                out->append("#raw<<");
                append_bytes(out, t.bytes());
                out->append(">>");
                return;
            }
        }
    } // namespace

    const char* term_kind_name(TermKind kind) noexcept {
        switch (kind) {
        case TermKind::Atom:
            return "atom";
        case TermKind::Boolean:
            return "boolean";
        case TermKind::Absent:
            return "absent";
        case TermKind::SmallInteger:
            return "small_integer";
        case TermKind::Integer32:
            return "integer32";
        case TermKind::Integer64:
            return "integer64";
        case TermKind::Float64:
            return "float64";
        case TermKind::Binary:
            return "binary";
        case TermKind::Text:
            return "text";
        case TermKind::List:
            return "list";
        case TermKind::Map:
            return "map";
        case TermKind::RawSpan:
            return "raw_span";
        }
        return "unknown";
    }

    Term Term::atom(std::string name) {
        return Term(TermKind::Atom, Payload{std::in_place_type<std::string>, std::move(name)});
    }

    Term Term::boolean(bool v) noexcept {
        return Term(TermKind::Boolean, Payload{std::in_place_type<bool>, v});
    }

    Term Term::absent() noexcept {
        return Term();
    }

    Term Term::small_integer(u8 v) noexcept {
        return Term(TermKind::SmallInteger, Payload{std::in_place_type<u8>, v});
    }

    Term Term::integer32(i32 v) noexcept {
        return Term(TermKind::Integer32, Payload{std::in_place_type<i32>, v});
    }

    Term Term::integer64(i64 v) noexcept {
        return Term(TermKind::Integer64, Payload{std::in_place_type<i64>, v});
    }

    Term Term::float64(double v) noexcept {
        return Term(TermKind::Float64, Payload{std::in_place_type<double>, v});
    }

    Term Term::binary(Bytes bytes) {
        return Term(TermKind::Binary, Payload{std::make_shared<const Bytes>(std::move(bytes))});
    }

    Term Term::text(std::string s) {
        return Term(TermKind::Text, Payload{std::in_place_type<std::string>, std::move(s)});
    }

    Term Term::list(TermList items) {
        return Term(TermKind::List, Payload{std::make_shared<const TermList>(std::move(items))});
    }

    Term Term::map(TermMap entries) {
        return Term(TermKind::Map, Payload{std::make_shared<const TermMap>(std::move(entries))});
    }

    Term Term::raw_span(Bytes bytes) {
        return Term(TermKind::RawSpan, Payload{std::make_shared<const Bytes>(std::move(bytes))});
    }

    const std::string& Term::atom_name() const noexcept {
        if (kind_ != TermKind::Atom) {
            return empty_string();
        }
        return std::get<std::string>(payload_);
    }

    const std::string& Term::text() const noexcept {
        if (kind_ != TermKind::Text) {
            return empty_string();
        }
        return std::get<std::string>(payload_);
    }

    bool Term::boolean_value() const noexcept {
        const bool* v = std::get_if<bool>(&payload_);
        return v != nullptr && *v;
    }

    u8 Term::small_integer_value() const noexcept {
        const u8* v = std::get_if<u8>(&payload_);
        return v != nullptr ? *v : u8{0};
    }

    i32 Term::integer32_value() const noexcept {
        const i32* v = std::get_if<i32>(&payload_);
        return v != nullptr ? *v : i32{0};
    }

    i64 Term::integer64_value() const noexcept {
        const i64* v = std::get_if<i64>(&payload_);
        return v != nullptr ? *v : i64{0};
    }

    double Term::float64_value() const noexcept {
        const double* v = std::get_if<double>(&payload_);
        return v != nullptr ? *v : 0.0;
    }

    const Bytes& Term::bytes() const noexcept {
        const auto* p = std::get_if<std::shared_ptr<const Bytes>>(&payload_);
        return (p != nullptr && *p) ? **p : empty_bytes();
    }

    const TermList& Term::list() const noexcept {
        const auto* p = std::get_if<std::shared_ptr<const TermList>>(&payload_);
        return (p != nullptr && *p) ? **p : empty_list();
    }

    const TermMap& Term::map() const noexcept {
        const auto* p = std::get_if<std::shared_ptr<const TermMap>>(&payload_);
        return (p != nullptr && *p) ? **p : empty_map();
    }

    bool Term::shares_payload_with(const Term& other) const noexcept {
        if (kind_ != other.kind_) {
            return false;
        }
        switch (kind_) {
        case TermKind::Binary:
        case TermKind::RawSpan:
            return &bytes() == &other.bytes();
        case TermKind::List:
            return &list() == &other.list();
        case TermKind::Map:
            return &map() == &other.map();
        default:
            return false;
        }
    }

    bool operator==(const Term& a, const Term& b) {
        if (a.kind_ != b.kind_) {
            return false;
        }
        switch (a.kind_) {
        case TermKind::Binary:
        case TermKind::RawSpan:
            return a.bytes() == b.bytes();
        case TermKind::List:
            return a.list() == b.list();
        case TermKind::Map:
            return a.map() == b.map();
        default:
            return a.payload_ == b.payload_;
        }
    }

    std::string format_term(const Term& term) {
        std::string out;
        format_into(term, &out);
        return out;
    }
} // namespace etfcast::wire
