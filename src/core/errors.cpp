#include "etfcast/core/errors.hpp"

#include <cstdio>

namespace etfcast::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok:
            return "ok";
        case StatusCode::Unknown:
            return "unknown";
        case StatusCode::Invalid:
            return "invalid";
        case StatusCode::Truncated:
            return "truncated";
        case StatusCode::UnknownTag:
            return "unknown_tag";
        case StatusCode::BadVersion:
            return "bad_version";
        case StatusCode::TooLarge:
            return "too_large";
        case StatusCode::TooDeep:
            return "too_deep";
        case StatusCode::Overflow:
            return "overflow";
        case StatusCode::TypeMismatch:
            return "type_mismatch";
        case StatusCode::NotWritable:
            return "not_writable";
        case StatusCode::Io:
            return "io";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core:
            return "core";
        case StatusDomain::Wire:
            return "wire";
        case StatusDomain::Cast:
            return "cast";
        case StatusDomain::Cli:
            return "cli";
        }
        return "unknown";
    }

    std::string format_error(const ErrorDetail& detail) {
        std::string out;
        out += status_domain_name(detail.status.domain);
        out += '/';
        out += status_code_name(detail.status.code);

        if (detail.status.domain == StatusDomain::Wire) {
            char buf[48];
            std::snprintf(buf, sizeof(buf), " at offset %u", detail.offset);
            out += buf;
        }
        if (detail.has_tag) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), " tag %u", static_cast<unsigned>(detail.tag));
            out += buf;
        }
        if (!detail.path.empty()) {
            out += " (path ";
            out += detail.path;
            out += ')';
        }
        if (!detail.message.empty()) {
            out += ": ";
            out += detail.message;
        }
        return out;
    }
} // namespace etfcast::core
