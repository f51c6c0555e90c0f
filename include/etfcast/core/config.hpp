#pragma once

#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"

namespace etfcast::core {

    // How `l` lists are terminated on the wire
    enum class ListTail : u8 {
        Required = 0,   // standard ETF: a `j` tail follows the elements
        Omitted = 1,    // producer writes the elements only
    };

    inline constexpr u32 kDefaultMaxDepth = 256;

    // Decoder configuration
    struct DecoderConfig {
        u32 max_depth{kDefaultMaxDepth};        // Nesting limit for lists, maps and records
        ListTail list_tail{ListTail::Required}; // List framing expected from the producer
        bool trace{false};                      // Log failures to stderr
    };

    // Overlay ETFCAST_MAX_DEPTH, ETFCAST_LIST_TAIL and ETFCAST_TRACE on *out.
    // Unset variables leave the field alone; malformed values return Core/Invalid
    // and leave *out untouched.
    [[nodiscard]] Status decoder_config_from_env(DecoderConfig* out) noexcept;

} // namespace etfcast::core
