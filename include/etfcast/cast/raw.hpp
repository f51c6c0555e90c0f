#pragma once

#include <utility>

#include "etfcast/core/config.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"
#include "etfcast/wire/term.hpp"

namespace etfcast::cast {

    // Exact wire bytes of a subtree (tag included) captured instead of decoded.
    // cast_into() decodes them later; nested RawData destinations capture again.
    class RawData {
    public:
        RawData() = default;
        explicit RawData(wire::Bytes bytes) noexcept : bytes_(std::move(bytes)) {}

        [[nodiscard]] const wire::Bytes& bytes() const noexcept { return bytes_; }
        [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
        [[nodiscard]] core::BufferView view() const noexcept {
            return core::BufferView{bytes_.data(), static_cast<core::u32>(bytes_.size())};
        }

        // Defined in etfcast/cast/engine.hpp.
        template <typename T>
        [[nodiscard]] core::Status cast_into(T* out,
                                             const core::DecoderConfig& cfg = core::DecoderConfig{},
                                             core::ErrorDetail* error = nullptr) const;

        friend bool operator==(const RawData&, const RawData&) = default;

    private:
        wire::Bytes bytes_;
    };

    // A decoded term kept for a later cast into a type chosen by the caller.
    class UncastedResult {
    public:
        UncastedResult() = default;
        explicit UncastedResult(wire::Term term) noexcept : term_(std::move(term)) {}

        [[nodiscard]] const wire::Term& term() const noexcept { return term_; }

        // Defined in etfcast/cast/engine.hpp.
        template <typename T>
        [[nodiscard]] core::Status cast_into(T* out,
                                             const core::DecoderConfig& cfg = core::DecoderConfig{},
                                             core::ErrorDetail* error = nullptr) const;

    private:
        wire::Term term_;
    };

} // namespace etfcast::cast
