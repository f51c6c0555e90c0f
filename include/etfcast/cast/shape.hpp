#pragma once

#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "etfcast/cast/raw.hpp"
#include "etfcast/cast/record.hpp"
#include "etfcast/wire/term.hpp"

namespace etfcast::cast {

    // What a destination leaf can receive; drives the cast dispatch.
    enum class TargetShape : core::u8 {
        Unsupported = 0,
        Opaque,         // wire::Term
        Deferred,       // UncastedResult
        Raw,            // RawData
        Atom,
        Boolean,
        Integer,
        Float,
        Text,           // std::string
        Bytes,          // wire::Bytes
        SequenceAny,    // wire::TermList
        Sequence,       // std::vector<E>
        MapAny,         // wire::TermMap
        Map,            // std::map / std::unordered_map
        Record,
    };

    [[nodiscard]] const char* shape_name(TargetShape shape) noexcept;

    template <typename T>
    struct is_std_vector : std::false_type {};

    template <typename E, typename A>
    struct is_std_vector<std::vector<E, A>> : std::true_type {};

    template <typename T>
    struct is_std_map : std::false_type {};

    template <typename K, typename V, typename C, typename A>
    struct is_std_map<std::map<K, V, C, A>> : std::true_type {};

    template <typename K, typename V, typename H, typename E, typename A>
    struct is_std_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

    template <typename T>
    [[nodiscard]] constexpr TargetShape shape_of() noexcept {
        using U = std::remove_cv_t<T>;
        if constexpr (std::is_same_v<U, wire::Term>) {
            return TargetShape::Opaque;
        } else if constexpr (std::is_same_v<U, UncastedResult>) {
            return TargetShape::Deferred;
        } else if constexpr (std::is_same_v<U, RawData>) {
            return TargetShape::Raw;
        } else if constexpr (std::is_same_v<U, wire::Atom>) {
            return TargetShape::Atom;
        } else if constexpr (std::is_same_v<U, bool>) {
            return TargetShape::Boolean;
        } else if constexpr (std::is_integral_v<U>) {
            return TargetShape::Integer;
        } else if constexpr (std::is_floating_point_v<U>) {
            return TargetShape::Float;
        } else if constexpr (std::is_same_v<U, std::string>) {
            return TargetShape::Text;
        } else if constexpr (std::is_same_v<U, wire::Bytes>) {
            return TargetShape::Bytes;
        } else if constexpr (std::is_same_v<U, wire::TermList>) {
            return TargetShape::SequenceAny;
        } else if constexpr (std::is_same_v<U, wire::TermMap>) {
            return TargetShape::MapAny;
        } else if constexpr (is_std_vector<U>::value) {
            return TargetShape::Sequence;
        } else if constexpr (is_std_map<U>::value) {
            return TargetShape::Map;
        } else if constexpr (is_record_v<U>) {
            return TargetShape::Record;
        } else {
            return TargetShape::Unsupported;
        }
    }

    // SmallInteger (0..255) fits any integer whose range covers it.
    template <typename D>
    [[nodiscard]] constexpr bool accepts_small_integer() noexcept {
        if constexpr (std::is_integral_v<D> && !std::is_same_v<D, bool>) {
            return std::numeric_limits<D>::max() >= 255;
        } else {
            return false;
        }
    }

    template <typename D>
    inline constexpr bool accepts_small_integer_v = accepts_small_integer<D>();

    // Signed wire integers go to signed integers at least as wide.
    template <typename D, typename S>
    inline constexpr bool accepts_signed_v =
        std::is_integral_v<D> && !std::is_same_v<D, bool> && std::is_signed_v<D> && sizeof(D) >= sizeof(S);

    template <typename D>
    inline constexpr bool accepts_float64_v = std::is_floating_point_v<D> && sizeof(D) >= sizeof(double);

} // namespace etfcast::cast
