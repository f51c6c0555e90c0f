#include "etfcast/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace etfcast::cli {
    namespace {
        using etfcast::core::Status;
        using etfcast::core::StatusCode;
        using etfcast::core::StatusDomain;

        [[nodiscard]] constexpr Status invalid() noexcept {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name,
                                                  std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return etfcast::core::ok_status();
        }

        // Stores `value` (null for a flag) according to the option's declared type.
        [[nodiscard]] Status store(const OptionSpec& spec, const char* value, ParsedOptions* out) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
            case OptionType::Flag:
                if (value != nullptr) return invalid();
                opt.value.boolv = 1;
                break;
            case OptionType::String:
                if (value == nullptr) return invalid();
                opt.value.str = value;
                break;
            case OptionType::I64:
                if (!parse_i64(value, &opt.value.i64v)) return invalid();
                break;
            default:
                return invalid();
            }
            return push_option(out, opt);
        }

        constexpr OptionSpec kEtfcatOptions[] = {
            {OptionId::File, OptionType::String, "file", 'f'},
            {OptionId::Hex, OptionType::Flag, "hex", 'x'},
            {OptionId::MaxDepth, OptionType::I64, "max-depth", 'd'},
            {OptionId::OmitListTail, OptionType::Flag, "omit-list-tail", '\0'},
            {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        };
    } // namespace

    const OptionSpec* etfcat_options(u32* count) noexcept {
        *count = static_cast<u32>(sizeof(kEtfcatOptions) / sizeof(kEtfcatOptions[0]));
        return kEtfcatOptions;
    }

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            if (tok[1] == '-') {
                // --name, --name=value, --name value
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (spec == nullptr) {
                    return invalid();
                }
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                // -x, -fvalue, -f value
                spec = find_short(specs, spec_count, tok[1]);
                if (spec == nullptr) {
                    return invalid();
                }
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            ++i;

            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return invalid();
                }
                value = args.argv[i++];
            }

            const Status s = store(*spec, value, out);
            if (!etfcast::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return etfcast::core::ok_status();
    }
} // namespace etfcast::cli
