#include "etfcast/wire/cursor.hpp"

namespace etfcast::wire {
    namespace {
        using etfcast::core::Status;
        using etfcast::core::StatusCode;
        using etfcast::core::StatusDomain;

        Status underrun(u32 pos) noexcept {
            return etfcast::core::make_status(StatusDomain::Wire, StatusCode::Truncated, pos);
        }

        u16 get_u16_be(const u8* p) noexcept {
            return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
        }

        u32 get_u32_be(const u8* p) noexcept {
            return (static_cast<u32>(p[0]) << 24) |
                   (static_cast<u32>(p[1]) << 16) |
                   (static_cast<u32>(p[2]) << 8) |
                   (static_cast<u32>(p[3]) << 0);
        }
    } // namespace

    Status ByteCursor::read_byte(u8* out) noexcept {
        if (!has_bytes(1)) {
            return underrun(pos_);
        }
        *out = in_.data[pos_++];
        return etfcast::core::ok_status();
    }

    Status ByteCursor::read_exact(u32 n, BufferView* out) noexcept {
        if (!has_bytes(n)) {
            return underrun(pos_);
        }
        out->data = in_.data + pos_;
        out->len = n;
        pos_ += n;
        return etfcast::core::ok_status();
    }

    Status ByteCursor::read_u16_be(u16* out) noexcept {
        if (!has_bytes(2)) {
            return underrun(pos_);
        }
        *out = get_u16_be(in_.data + pos_);
        pos_ += 2;
        return etfcast::core::ok_status();
    }

    Status ByteCursor::read_u32_be(u32* out) noexcept {
        if (!has_bytes(4)) {
            return underrun(pos_);
        }
        *out = get_u32_be(in_.data + pos_);
        pos_ += 4;
        return etfcast::core::ok_status();
    }

    BufferView ByteCursor::consumed_since(u32 start) const noexcept {
        if (start > pos_ || in_.data == nullptr) {
            return BufferView{};
        }
        return BufferView{in_.data + start, pos_ - start};
    }
} // namespace etfcast::wire
