#include "etfcast/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace etfcast::core {
    namespace {
        [[nodiscard]] bool parse_u32(const char* s, u32* out) noexcept {
            if (s == nullptr || out == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u32 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }
    } // namespace

    Status decoder_config_from_env(DecoderConfig* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        DecoderConfig cfg = *out;

        const char* depth = std::getenv("ETFCAST_MAX_DEPTH");
        if (depth != nullptr) {
            u32 v = 0;
            if (!parse_u32(depth, &v) || v == 0) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            cfg.max_depth = v;
        }

        const char* tail = std::getenv("ETFCAST_LIST_TAIL");
        if (tail != nullptr) {
            if (std::strcmp(tail, "required") == 0) {
                cfg.list_tail = ListTail::Required;
            } else if (std::strcmp(tail, "omitted") == 0) {
                cfg.list_tail = ListTail::Omitted;
            } else {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
        }

        const char* trace = std::getenv("ETFCAST_TRACE");
        if (trace != nullptr) {
            if (std::strcmp(trace, "1") == 0) {
                cfg.trace = true;
            } else if (std::strcmp(trace, "0") == 0) {
                cfg.trace = false;
            } else {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
        }

        *out = cfg;
        return ok_status();
    }
} // namespace etfcast::core
