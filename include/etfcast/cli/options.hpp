#pragma once

#include <type_traits>

#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"

namespace etfcast::cli {
    using u8 = etfcast::core::u8;
    using u32 = etfcast::core::u32;
    using i64 = etfcast::core::i64;

    // argv after the program name and the command word.
    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    // How an option's argument is read: none, verbatim, or as a decimal integer.
    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    // etfcat's options. apply_options maps each onto DecoderConfig or InputOptions.
    enum class OptionId : u32 {
        None = 0,
        File = 1,          // -f, --file PATH
        Hex = 2,           // -x, --hex
        MaxDepth = 3,      // -d, --max-depth N
        OmitListTail = 4,  // --omit-list-tail
        Verbose = 5,       // -v, --verbose
    };

    // short_name '\0' means long form only.
    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    // `str` points into argv; nothing is copied.
    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options fails with Cli/Invalid once cap is hit.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // The option table shared by etfcat dump and check.
    [[nodiscard]] const OptionSpec* etfcat_options(u32* count) noexcept;

    // Parses leading options and stops at the first positional token or "--".
    // *consumed is the number of tokens used, "--" included. Long options take
    // "--name value" or "--name=value", short ones "-d value" or "-d12".
    [[nodiscard]] etfcast::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace etfcast::cli
