#include <gtest/gtest.h>
#include "deepcheck/compare.hpp"
#include "deepcheck/options.hpp"
#include "test_env.hpp"
#include <cstdlib>

using namespace deepcheck;

TEST(Options, DefaultsWithCleanEnvironment){
    ScopedEnv a("DEEPCHECK_TRACE", nullptr);
    ScopedEnv b("DEEPCHECK_DIAG_JSON", nullptr);
    ScopedEnv c("DEEPCHECK_CYCLE_GUARD", nullptr);
    ScopedEnv d("DEEPCHECK_NAME_RECOGNIZER", nullptr);
    auto env = detectEnv();
    EXPECT_FALSE(env.traceCompare);
    EXPECT_FALSE(env.diagJson);
    EXPECT_TRUE(env.cycleGuard);
    EXPECT_EQ(env.recognizer, "synthesized");
}

TEST(Options, FlagsAreRead){
    ScopedEnv a("DEEPCHECK_TRACE", "1");
    ScopedEnv b("DEEPCHECK_DIAG_JSON", "yes");
    ScopedEnv c("DEEPCHECK_CYCLE_GUARD", "0");
    ScopedEnv d("DEEPCHECK_NAME_RECOGNIZER", "PLAIN");
    auto env = detectEnv();
    EXPECT_TRUE(env.traceCompare);
    EXPECT_TRUE(env.diagJson);
    EXPECT_FALSE(env.cycleGuard);
    EXPECT_EQ(env.recognizer, "plain");

    auto opts = CompareOptions::from_env(env);
    EXPECT_EQ(opts.names, &plain_recognizer());
    EXPECT_FALSE(opts.detect_cycles);
    EXPECT_TRUE(opts.trace);
}

TEST(Options, UnknownRecognizerKeepsDefault){
    ScopedEnv d("DEEPCHECK_NAME_RECOGNIZER", "fancy");
    EXPECT_EQ(detectEnv().recognizer, "synthesized");
}

TEST(Options, FalseyFlagValues){
    ScopedEnv a("DEEPCHECK_TRACE", "0");
    ScopedEnv c("DEEPCHECK_CYCLE_GUARD", "true");
    auto env = detectEnv();
    EXPECT_FALSE(env.traceCompare);
    EXPECT_TRUE(env.cycleGuard);
    EXPECT_FALSE(env_flag_enabled("DEEPCHECK_TRACE"));
}

#ifndef _WIN32
TEST(ScopedEnvTest, RestoresEmptyAndAbsentValues){
    ::setenv("DEEPCHECK_TRACE", "", 1);
    {
        ScopedEnv a("DEEPCHECK_TRACE", "1");
        EXPECT_TRUE(env_flag_enabled("DEEPCHECK_TRACE"));
    }
    const char* restored = std::getenv("DEEPCHECK_TRACE");
    ASSERT_NE(restored, nullptr);
    EXPECT_STREQ(restored, "");

    ::unsetenv("DEEPCHECK_TRACE");
    {
        ScopedEnv a("DEEPCHECK_TRACE", "1");
    }
    EXPECT_EQ(std::getenv("DEEPCHECK_TRACE"), nullptr);
}
#endif
