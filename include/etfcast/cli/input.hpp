#pragma once

#include <string>
#include <vector>

#include "etfcast/cli/options.hpp"
#include "etfcast/core/config.hpp"
#include "etfcast/core/errors.hpp"

namespace etfcast::cli {
    struct InputOptions {
        const char* path{nullptr};  // null or "-" reads stdin
        bool hex{false};
        bool verbose{false};
    };

    // Folds parsed options into the decoder configuration and input settings.
    // A max depth outside 1..2^32-1 is Cli/Invalid.
    [[nodiscard]] etfcast::core::Status apply_options(const ParsedOptions& parsed,
        etfcast::core::DecoderConfig* cfg,
        InputOptions* input) noexcept;

    // Hex text to bytes. Whitespace, commas and an optional "0x" prefix per
    // byte group are ignored; anything else or an odd digit count is Cli/Invalid.
    [[nodiscard]] etfcast::core::Status decode_hex(const std::string& text, std::vector<u8>* out);

    // Whole file, or stdin when path is null or "-". Failures are Cli/Io with
    // errno in aux.
    [[nodiscard]] etfcast::core::Status read_input(const char* path, std::vector<u8>* out);

} // namespace etfcast::cli
