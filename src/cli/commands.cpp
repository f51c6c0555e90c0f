#include "etfcast/cli/commands.hpp"

#include <cstring>

namespace etfcast::cli {
    etfcast::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        using etfcast::core::StatusCode;
        using etfcast::core::StatusDomain;

        if (out == nullptr || consumed == nullptr) {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* name = args.argv[0];
        if (name[0] == '-') {
            return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return etfcast::core::ok_status();
            }
        }
        return etfcast::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
} // namespace etfcast::cli
