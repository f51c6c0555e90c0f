#include <array>

#include <gtest/gtest.h>

#include "etfcast/cli/commands.hpp"

namespace {
    const std::array<etfcast::cli::CommandSpec, 3> kCommands = {{
        {etfcast::cli::CommandId::Help, "help"},
        {etfcast::cli::CommandId::Dump, "dump"},
        {etfcast::cli::CommandId::Check, "check"},
    }};
} // namespace

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const char* argv[] = {"dump", "-x", "--file", "in.hex"};
    etfcast::cli::CommandInvocation out{};
    etfcast::cli::u32 consumed = 0;
    const etfcast::core::Status s =
        etfcast::cli::parse_command({argv, 4}, kCommands.data(), kCommands.size(), &out, &consumed);
    ASSERT_EQ(s.code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, etfcast::cli::CommandId::Dump);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "-x");
}

TEST(CliCommands, InvalidOnUnknownCommandOrLeadingOption) {
    etfcast::cli::CommandInvocation out{};
    etfcast::cli::u32 consumed = 0;

    const char* unknown[] = {"encode"};
    EXPECT_EQ(etfcast::cli::parse_command({unknown, 1}, kCommands.data(), kCommands.size(), &out, &consumed).code,
              etfcast::core::StatusCode::Invalid);
    EXPECT_EQ(out.id, etfcast::cli::CommandId::None);

    const char* option[] = {"-x", "dump"};
    EXPECT_EQ(etfcast::cli::parse_command({option, 2}, kCommands.data(), kCommands.size(), &out, &consumed).code,
              etfcast::core::StatusCode::Invalid);

    EXPECT_EQ(etfcast::cli::parse_command({nullptr, 0}, kCommands.data(), kCommands.size(), &out, &consumed).code,
              etfcast::core::StatusCode::Invalid);
}
