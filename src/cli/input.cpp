#include "etfcast/cli/input.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <utility>

namespace etfcast::cli {
    namespace {
        using etfcast::core::Status;
        using etfcast::core::StatusCode;
        using etfcast::core::StatusDomain;

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] bool is_separator(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',';
        }

        [[nodiscard]] Status io_error(int err) noexcept {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<u32>(err));
        }

        Status read_stream(std::FILE* f, std::vector<u8>* out) {
            u8 chunk[4096];
            for (;;) {
                const std::size_t n = std::fread(chunk, 1, sizeof(chunk), f);
                out->insert(out->end(), chunk, chunk + n);
                if (n < sizeof(chunk)) {
                    if (std::ferror(f) != 0) {
                        return io_error(errno != 0 ? errno : EIO);
                    }
                    break;
                }
            }
            return etfcast::core::ok_status();
        }
    } // namespace

    Status apply_options(const ParsedOptions& parsed, etfcast::core::DecoderConfig* cfg, InputOptions* input) noexcept {
        if (cfg == nullptr || input == nullptr) {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        for (u32 i = 0; i < parsed.len; ++i) {
            const ParsedOption& opt = parsed.data[i];
            switch (opt.id) {
            case OptionId::File:
                input->path = opt.value.str;
                break;
            case OptionId::Hex:
                input->hex = true;
                break;
            case OptionId::MaxDepth:
                if (opt.value.i64v <= 0 || opt.value.i64v > std::numeric_limits<u32>::max()) {
                    return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid,
                                                      static_cast<u32>(OptionId::MaxDepth));
                }
                cfg->max_depth = static_cast<u32>(opt.value.i64v);
                break;
            case OptionId::OmitListTail:
                cfg->list_tail = etfcast::core::ListTail::Omitted;
                break;
            case OptionId::Verbose:
                input->verbose = true;
                cfg->trace = true;
                break;
            case OptionId::None:
                break;
            }
        }
        return etfcast::core::ok_status();
    }

    Status decode_hex(const std::string& text, std::vector<u8>* out) {
        if (out == nullptr) {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        std::vector<u8> bytes;
        bytes.reserve(text.size() / 2);

        std::size_t i = 0;
        while (i < text.size()) {
            if (is_separator(text[i])) {
                ++i;
                continue;
            }
            if (text[i] == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
                i += 2;
            }
            std::size_t digits = 0;
            int high = -1;
            while (i < text.size() && !is_separator(text[i])) {
                const int v = hex_value(text[i]);
                if (v < 0) {
                    return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid, static_cast<u32>(i));
                }
                if (high < 0) {
                    high = v;
                } else {
                    bytes.push_back(static_cast<u8>((high << 4) | v));
                    high = -1;
                }
                ++digits;
                ++i;
            }
            if (digits == 0 || high >= 0) {
                return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid, static_cast<u32>(i));
            }
        }
        *out = std::move(bytes);
        return etfcast::core::ok_status();
    }

    Status read_input(const char* path, std::vector<u8>* out) {
        if (out == nullptr) {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        out->clear();
        if (path == nullptr || std::strcmp(path, "-") == 0) {
            return read_stream(stdin, out);
        }

        std::FILE* f = std::fopen(path, "rb");
        if (f == nullptr) {
            return io_error(errno);
        }
        const Status s = read_stream(f, out);
        std::fclose(f);
        return s;
    }
} // namespace etfcast::cli
