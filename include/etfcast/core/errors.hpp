#pragma once
#include <cstdint>
#include <string>
#include <type_traits>

namespace etfcast::core {
    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        Truncated,
        UnknownTag,
        BadVersion,
        TooLarge,
        TooDeep,
        Overflow,
        TypeMismatch,
        NotWritable,
        Io,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Wire,
        Cast,
        Cli,
    };

    // aux: byte offset for Wire failures, term kind for Cast failures.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    // First failure of a decode call. Filled only when the caller passes one in.
    struct ErrorDetail {
        Status status{};
        u32 offset{0};
        u8 tag{0};
        bool has_tag{false};
        const char* term_kind{nullptr};
        const char* target_shape{nullptr};
        std::string path;
        std::string message;
    };

    // "wire/truncated at offset 7 (path .items[2]): need 4 bytes, 1 left"
    [[nodiscard]] std::string format_error(const ErrorDetail& detail);

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace etfcast::core
