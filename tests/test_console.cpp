// ═══════════════════════════════════════════════════════════════════
//  test_console.cpp — Tests for leveled console logging
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "dlproxy/console.h"

#include <string>

using namespace dlproxy;

namespace {

class ConsoleTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = console::level();
        console::setColors(false);
    }

    void TearDown() override {
        console::setLevel(saved_);
        console::setColors(true);
    }

private:
    console::Level saved_ = console::Level::Info;
};

} // namespace

TEST(ConsoleLevelTest, ParseLevel) {
    EXPECT_EQ(console::parseLevel("debug"), console::Level::Debug);
    EXPECT_EQ(console::parseLevel("info"), console::Level::Info);
    EXPECT_EQ(console::parseLevel("warn"), console::Level::Warn);
    EXPECT_EQ(console::parseLevel("warning"), console::Level::Warn);
    EXPECT_EQ(console::parseLevel("error"), console::Level::Error);
    EXPECT_EQ(console::parseLevel("silent"), console::Level::Silent);
    EXPECT_FALSE(console::parseLevel("loud"));
    EXPECT_FALSE(console::parseLevel("INFO"));
}

TEST_F(ConsoleTest, SetLevelIsReadBack) {
    console::setLevel(console::Level::Warn);
    EXPECT_EQ(console::level(), console::Level::Warn);
    console::setLevel(console::Level::Debug);
    EXPECT_EQ(console::level(), console::Level::Debug);
}

TEST_F(ConsoleTest, LogJoinsArgumentsWithSpaces) {
    console::setLevel(console::Level::Info);

    ::testing::internal::CaptureStdout();
    console::log("relayed", 42, "bytes", true);
    auto out = ::testing::internal::GetCapturedStdout();

    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), '[');
    EXPECT_NE(out.find("relayed 42 bytes true\n"), std::string::npos);
    EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST_F(ConsoleTest, LinesBelowThresholdAreDropped) {
    console::setLevel(console::Level::Warn);

    ::testing::internal::CaptureStdout();
    console::log("hidden log");
    console::info("hidden info");
    console::debug("hidden debug");
    auto out = ::testing::internal::GetCapturedStdout();
    EXPECT_TRUE(out.empty());

    ::testing::internal::CaptureStderr();
    console::warn("upstream slow");
    console::error("upstream gone");
    auto err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("upstream slow"), std::string::npos);
    EXPECT_NE(err.find("upstream gone"), std::string::npos);
}

TEST_F(ConsoleTest, SilentDropsEverything) {
    console::setLevel(console::Level::Silent);

    ::testing::internal::CaptureStderr();
    console::error("nobody hears this");
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
}
