#pragma once

#include "etfcast/core/types.hpp"

namespace etfcast::wire {
    using u8 = etfcast::core::u8;

    inline constexpr u8 kVersionMagic = 131;

    inline constexpr u8 kTagNewFloat = 70;       // 'F'
    inline constexpr u8 kTagSmallInteger = 97;   // 'a'
    inline constexpr u8 kTagInteger = 98;        // 'b'
    inline constexpr u8 kTagAtom = 100;          // 'd', 2-byte length
    inline constexpr u8 kTagNil = 106;           // 'j'
    inline constexpr u8 kTagList = 108;          // 'l'
    inline constexpr u8 kTagBinary = 109;        // 'm'
    inline constexpr u8 kTagSmallBig = 110;      // 'n'
    inline constexpr u8 kTagSmallAtom = 115;     // 's'
    inline constexpr u8 kTagMap = 116;           // 't'
    inline constexpr u8 kTagAtomUtf8 = 118;      // 'v', 2-byte length
    inline constexpr u8 kTagSmallAtomUtf8 = 119; // 'w'

    [[nodiscard]] constexpr bool tag_is_atom(u8 tag) noexcept {
        return tag == kTagSmallAtom || tag == kTagSmallAtomUtf8 || tag == kTagAtom || tag == kTagAtomUtf8;
    }

    [[nodiscard]] constexpr bool tag_has_wide_atom_length(u8 tag) noexcept {
        return tag == kTagAtom || tag == kTagAtomUtf8;
    }

} // namespace etfcast::wire
