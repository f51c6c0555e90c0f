#include <cstdlib>

#include <gtest/gtest.h>

#include "etfcast/core/config.hpp"

namespace {
    void clear_env() {
        ::unsetenv("ETFCAST_MAX_DEPTH");
        ::unsetenv("ETFCAST_LIST_TAIL");
        ::unsetenv("ETFCAST_TRACE");
    }
} // namespace

TEST(DecoderConfig, Defaults) {
    const etfcast::core::DecoderConfig cfg{};
    EXPECT_EQ(cfg.max_depth, etfcast::core::kDefaultMaxDepth);
    EXPECT_EQ(cfg.list_tail, etfcast::core::ListTail::Required);
    EXPECT_FALSE(cfg.trace);
}

TEST(DecoderConfig, UnsetEnvironmentLeavesFieldsAlone) {
    clear_env();
    etfcast::core::DecoderConfig cfg{};
    cfg.max_depth = 12;
    cfg.list_tail = etfcast::core::ListTail::Omitted;
    ASSERT_EQ(etfcast::core::decoder_config_from_env(&cfg).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(cfg.max_depth, 12u);
    EXPECT_EQ(cfg.list_tail, etfcast::core::ListTail::Omitted);
}

TEST(DecoderConfig, OverlaysEnvironment) {
    clear_env();
    ::setenv("ETFCAST_MAX_DEPTH", "8", 1);
    ::setenv("ETFCAST_LIST_TAIL", "omitted", 1);
    ::setenv("ETFCAST_TRACE", "1", 1);

    etfcast::core::DecoderConfig cfg{};
    ASSERT_EQ(etfcast::core::decoder_config_from_env(&cfg).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(cfg.max_depth, 8u);
    EXPECT_EQ(cfg.list_tail, etfcast::core::ListTail::Omitted);
    EXPECT_TRUE(cfg.trace);
    clear_env();
}

TEST(DecoderConfig, InvalidValueLeavesConfigUntouched) {
    clear_env();
    ::setenv("ETFCAST_LIST_TAIL", "omitted", 1);
    ::setenv("ETFCAST_MAX_DEPTH", "0", 1);

    etfcast::core::DecoderConfig cfg{};
    const etfcast::core::Status s = etfcast::core::decoder_config_from_env(&cfg);
    EXPECT_EQ(s.code, etfcast::core::StatusCode::Invalid);
    EXPECT_EQ(s.domain, etfcast::core::StatusDomain::Core);
    EXPECT_EQ(cfg.max_depth, etfcast::core::kDefaultMaxDepth);
    EXPECT_EQ(cfg.list_tail, etfcast::core::ListTail::Required);

    ::setenv("ETFCAST_MAX_DEPTH", "12x", 1);
    EXPECT_EQ(etfcast::core::decoder_config_from_env(&cfg).code, etfcast::core::StatusCode::Invalid);

    clear_env();
    ::setenv("ETFCAST_TRACE", "yes", 1);
    EXPECT_EQ(etfcast::core::decoder_config_from_env(&cfg).code, etfcast::core::StatusCode::Invalid);
    clear_env();
}

TEST(DecoderConfig, NullOutIsInvalid) {
    EXPECT_EQ(etfcast::core::decoder_config_from_env(nullptr).code, etfcast::core::StatusCode::Invalid);
}
