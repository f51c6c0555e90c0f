#pragma once

#include <string>
#include <string_view>

#include "etfcast/core/config.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"

namespace etfcast::core {

    // State of one decode call: configuration, nesting depth, the path of the
    // value being produced and the caller's optional ErrorDetail sink.
    class DecodeContext {
    public:
        explicit DecodeContext(const DecoderConfig& cfg, ErrorDetail* detail = nullptr) noexcept
            : cfg_(cfg), detail_(detail) {}

        DecodeContext(const DecodeContext&) = delete;
        DecodeContext& operator=(const DecodeContext&) = delete;

        [[nodiscard]] const DecoderConfig& config() const noexcept { return cfg_; }
        [[nodiscard]] u32 depth() const noexcept { return depth_; }
        [[nodiscard]] const std::string& path() const noexcept { return path_; }

        // Only the first failure is recorded; later calls just return their status.
        Status fail_wire(StatusCode code, u32 offset, std::string_view message);
        Status fail_wire_tag(StatusCode code, u32 offset, u8 tag, std::string_view message);
        Status fail_cast(StatusCode code, u32 aux, const char* term_kind, const char* target_shape,
                         std::string_view message);
        // Records a status produced outside the decoder, such as a record's decode hook.
        Status fail_status(Status s, const char* term_kind, const char* target_shape, std::string_view message);

        [[nodiscard]] Status enter(u32 offset);
        void leave() noexcept;

        std::string::size_type push_path(char open, std::string_view segment, char close = '\0');
        void truncate_path(std::string::size_type mark) noexcept;

    private:
        void record(Status s, u32 offset, std::string_view message);

        DecoderConfig cfg_;
        ErrorDetail* detail_{nullptr};
        u32 depth_{0};
        bool failed_{false};
        std::string path_;
    };

    class DepthGuard {
    public:
        explicit DepthGuard(DecodeContext& ctx) noexcept : ctx_(ctx) {}
        ~DepthGuard() {
            if (entered_) {
                ctx_.leave();
            }
        }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        [[nodiscard]] Status enter(u32 offset) {
            const Status s = ctx_.enter(offset);
            entered_ = is_ok(s);
            return s;
        }

    private:
        DecodeContext& ctx_;
        bool entered_{false};
    };

    class PathScope {
    public:
        static PathScope field(DecodeContext& ctx, std::string_view name) {
            return PathScope(ctx, ctx.push_path('.', name));
        }
        static PathScope index(DecodeContext& ctx, u32 i) {
            return PathScope(ctx, ctx.push_path('[', std::to_string(i), ']'));
        }
        static PathScope entry(DecodeContext& ctx, u32 i) {
            return PathScope(ctx, ctx.push_path('{', std::to_string(i), '}'));
        }

        ~PathScope() {
            if (ctx_ != nullptr) {
                ctx_->truncate_path(mark_);
            }
        }

        PathScope(PathScope&& other) noexcept : ctx_(other.ctx_), mark_(other.mark_) {
            other.ctx_ = nullptr;
        }
        PathScope(const PathScope&) = delete;
        PathScope& operator=(const PathScope&) = delete;
        PathScope& operator=(PathScope&&) = delete;

    private:
        PathScope(DecodeContext& ctx, std::string::size_type mark) noexcept : ctx_(&ctx), mark_(mark) {}

        DecodeContext* ctx_{nullptr};
        std::string::size_type mark_{0};
    };

} // namespace etfcast::core
