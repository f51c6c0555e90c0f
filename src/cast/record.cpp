#include "etfcast/cast/record.hpp"

namespace etfcast::cast {
    FieldTable FieldTable::build(const FieldDecl* decls, u32 count) {
        FieldTable table;
        if (decls == nullptr) {
            return table;
        }
        for (u32 i = 0; i < count; ++i) {
            const FieldDecl& d = decls[i];
            const std::string_view tag = d.tag != nullptr ? std::string_view(d.tag) : std::string_view();
            if (tag == kSkipTag) {
                continue;
            }
            if (tag.empty()) {
                if (d.name == nullptr || *d.name == '\0') {
                    continue;
                }
                table.by_key_.insert_or_assign(std::string(d.name), i);
                continue;
            }
            table.by_key_.insert_or_assign(std::string(tag), i);
        }
        return table;
    }

    bool FieldTable::find(std::string_view key, u32* index) const noexcept {
        const auto it = by_key_.find(key);
        if (it == by_key_.end()) {
            return false;
        }
        if (index != nullptr) {
            *index = it->second;
        }
        return true;
    }
} // namespace etfcast::cast
