#include <gtest/gtest.h>
#include "ffistub/env.hpp"
#include "test_env.hpp"

using namespace ffistub;

TEST(EnvTest, FlagSpellings){
    _putenv("FFISTUB_TRACE=1");
    EXPECT_TRUE(flag_enabled("FFISTUB_TRACE"));
    EXPECT_TRUE(trace_enabled());
    _putenv("FFISTUB_TRACE=yes");
    EXPECT_TRUE(flag_enabled("FFISTUB_TRACE"));
    _putenv("FFISTUB_TRACE=0");
    EXPECT_FALSE(flag_enabled("FFISTUB_TRACE"));
    _putenv("FFISTUB_TRACE=");
    EXPECT_FALSE(flag_enabled("FFISTUB_TRACE"));
}

TEST(EnvTest, DetectEnvSnapshot){
    _putenv("FFISTUB_DIAG_JSON=true");
    _putenv("FFISTUB_TARGET_TRIPLE=aarch64-apple-darwin");
    _putenv("FFISTUB_EDITION=2024");
    auto env = detect_env();
    EXPECT_TRUE(env.diag_json);
    EXPECT_FALSE(env.trace);
    EXPECT_EQ(env.target_triple, "aarch64-apple-darwin");
    EXPECT_EQ(env.edition, "2024");

    _putenv("FFISTUB_DIAG_JSON=");
    _putenv("FFISTUB_TARGET_TRIPLE=");
    _putenv("FFISTUB_EDITION=");
    auto cleared = detect_env();
    EXPECT_FALSE(cleared.diag_json);
    EXPECT_TRUE(cleared.target_triple.empty());
    EXPECT_TRUE(cleared.edition.empty());
}
