#include "etfcast/core/context.hpp"

#include <cstdio>

namespace etfcast::core {
    Status DecodeContext::fail_wire(StatusCode code, u32 offset, std::string_view message) {
        const Status s = make_status(StatusDomain::Wire, code, offset);
        record(s, offset, message);
        return s;
    }

    Status DecodeContext::fail_wire_tag(StatusCode code, u32 offset, u8 tag, std::string_view message) {
        const bool first = !failed_;
        const Status s = fail_wire(code, offset, message);
        if (first && detail_ != nullptr) {
            detail_->tag = tag;
            detail_->has_tag = true;
        }
        return s;
    }

    Status DecodeContext::fail_cast(StatusCode code, u32 aux, const char* term_kind, const char* target_shape,
                                    std::string_view message) {
        return fail_status(make_status(StatusDomain::Cast, code, aux), term_kind, target_shape, message);
    }

    Status DecodeContext::fail_status(Status s, const char* term_kind, const char* target_shape,
                                      std::string_view message) {
        const bool first = !failed_;
        record(s, 0, message);
        if (first && detail_ != nullptr) {
            detail_->term_kind = term_kind;
            detail_->target_shape = target_shape;
        }
        return s;
    }

    Status DecodeContext::enter(u32 offset) {
        if (depth_ >= cfg_.max_depth) {
            return fail_wire(StatusCode::TooDeep, offset, "nesting exceeds max_depth");
        }
        ++depth_;
        return ok_status();
    }

    void DecodeContext::leave() noexcept {
        if (depth_ > 0) {
            --depth_;
        }
    }

    std::string::size_type DecodeContext::push_path(char open, std::string_view segment, char close) {
        const std::string::size_type mark = path_.size();
        path_ += open;
        path_.append(segment.data(), segment.size());
        if (close != '\0') {
            path_ += close;
        }
        return mark;
    }

    void DecodeContext::truncate_path(std::string::size_type mark) noexcept {
        if (mark < path_.size()) {
            path_.resize(mark);
        }
    }

    void DecodeContext::record(Status s, u32 offset, std::string_view message) {
        if (failed_) {
            return;
        }
        failed_ = true;

        if (detail_ != nullptr) {
            detail_->status = s;
            detail_->offset = offset;
            detail_->path = path_;
            detail_->message.assign(message.data(), message.size());
        }

        if (cfg_.trace) {
            std::fprintf(stderr, "etfcast: %s/%s at offset %u path '%s': %.*s\n",
                         status_domain_name(s.domain), status_code_name(s.code), offset,
                         path_.c_str(), static_cast<int>(message.size()), message.data());
        }
    }
} // namespace etfcast::core
