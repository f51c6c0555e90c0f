#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "etfcast/cast/raw.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"

namespace etfcast::cast {
    using u32 = etfcast::core::u32;

    // A record member and the key it is read from. A null or empty tag means the
    // member's own name; the tag "-" keeps the member out of decoding.
    template <typename Record, typename Member>
    struct Field {
        const char* name;
        Member Record::*member;
        const char* tag;
    };

    template <typename Record, typename Member>
    [[nodiscard]] constexpr Field<Record, Member> field(const char* name, Member Record::*member,
                                                        const char* tag = nullptr) noexcept {
        return Field<Record, Member>{name, member, tag};
    }

    // Specialise with `static auto fields()` returning a tuple of field(...):
    //
    //   template <> struct etfcast::cast::RecordFields<User> {
    //       static auto fields() {
    //           return std::make_tuple(ETFCAST_FIELD(User, id), ETFCAST_FIELD_TAG(User, name, "username"));
    //       }
    //   };
    template <typename T, typename = void>
    struct RecordFields {};

    template <typename T, typename = void>
    struct has_record_fields : std::false_type {};

    template <typename T>
    struct has_record_fields<T, std::void_t<decltype(RecordFields<T>::fields())>> : std::true_type {};

    // Records may take over decoding with
    //   etfcast::core::Status decode_etf(const etfcast::cast::UncastedResult&);
    template <typename T, typename = void>
    struct has_decode_hook : std::false_type {};

    template <typename T>
    struct has_decode_hook<T, std::void_t<decltype(std::declval<T&>().decode_etf(std::declval<const UncastedResult&>()))>>
        : std::is_same<decltype(std::declval<T&>().decode_etf(std::declval<const UncastedResult&>())), core::Status> {};

    template <typename T>
    inline constexpr bool has_decode_hook_v = has_decode_hook<T>::value;

    template <typename T>
    inline constexpr bool is_record_v = has_record_fields<T>::value || has_decode_hook_v<T>;

    inline constexpr std::string_view kSkipTag = "-";

    struct FieldDecl {
        const char* name{nullptr};
        const char* tag{nullptr};
    };

    // Wire key -> field index, derived once from a record's declarations.
    class FieldTable {
    public:
        [[nodiscard]] static FieldTable build(const FieldDecl* decls, u32 count);

        [[nodiscard]] bool find(std::string_view key, u32* index) const noexcept;
        [[nodiscard]] u32 size() const noexcept { return static_cast<u32>(by_key_.size()); }

    private:
        std::map<std::string, u32, std::less<>> by_key_;
    };

    template <typename T>
    const FieldTable& field_table_for() {
        static const FieldTable table = [] {
            std::vector<FieldDecl> decls;
            std::apply([&](const auto&... f) { (decls.push_back(FieldDecl{f.name, f.tag}), ...); },
                       RecordFields<T>::fields());
            return FieldTable::build(decls.data(), static_cast<u32>(decls.size()));
        }();
        return table;
    }

    // Calls fn(record.*member) for the field at `index`.
    template <typename T, typename Fn>
    core::Status visit_field(T& record, u32 index, Fn&& fn) {
        return std::apply(
            [&](const auto&... f) {
                core::Status st = core::make_status(core::StatusDomain::Cast, core::StatusCode::Invalid, index);
                u32 i = 0;
                ((i++ == index ? (void)(st = fn(record.*(f.member))) : (void)0), ...);
                return st;
            },
            RecordFields<T>::fields());
    }

} // namespace etfcast::cast

#define ETFCAST_FIELD(Type, member) ::etfcast::cast::field(#member, &Type::member)
#define ETFCAST_FIELD_TAG(Type, member, tag) ::etfcast::cast::field(#member, &Type::member, tag)
