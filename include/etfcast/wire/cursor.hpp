#pragma once

#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"

namespace etfcast::wire {
    using u8 = etfcast::core::u8;
    using u16 = etfcast::core::u16;
    using u32 = etfcast::core::u32;
    using BufferView = etfcast::core::BufferView;

    // Forward-only reader. A failed read returns Wire/Truncated with the
    // current offset in aux and leaves the position unchanged.
    class ByteCursor {
    public:
        ByteCursor() noexcept = default;
        explicit ByteCursor(BufferView in) noexcept : in_(in) {}

        [[nodiscard]] etfcast::core::Status read_byte(u8* out) noexcept;
        [[nodiscard]] etfcast::core::Status read_exact(u32 n, BufferView* out) noexcept;
        [[nodiscard]] etfcast::core::Status read_u16_be(u16* out) noexcept;
        [[nodiscard]] etfcast::core::Status read_u32_be(u32* out) noexcept;

        [[nodiscard]] u32 position() const noexcept { return pos_; }
        [[nodiscard]] u32 remaining() const noexcept { return in_.len - pos_; }
        [[nodiscard]] bool at_end() const noexcept { return pos_ >= in_.len; }

        // Bytes consumed between `start` and the current position.
        [[nodiscard]] BufferView consumed_since(u32 start) const noexcept;

    private:
        [[nodiscard]] bool has_bytes(u32 n) const noexcept {
            return in_.data != nullptr && n <= in_.len - pos_;
        }

        BufferView in_{};
        u32 pos_{0};
    };

} // namespace etfcast::wire
