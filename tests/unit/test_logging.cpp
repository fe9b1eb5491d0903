/**
 * @file test_logging.cpp
 * @brief Unit tests for the callback-based logger.
 */

#include <gtest/gtest.h>
#include <gr8/logging.h>
#include <string>
#include <vector>

using namespace gr8;

namespace {

struct Captured {
    gr8_log_level level;
    std::string subsystem;
    std::string message;
};

void capture(gr8_log_level level, const char* subsystem, const char* message, void* userdata) {
    auto* sink = static_cast<std::vector<Captured>*>(userdata);
    sink->push_back({level, subsystem, message});
}

} // namespace

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = gr8_get_log_level();
        gr8_set_log_callback(capture, &messages_);
        gr8_set_log_level(GR8_LOG_INFO);
    }

    void TearDown() override {
        gr8_set_log_callback(nullptr, nullptr);
        gr8_set_log_level(saved_level_);
    }

    std::vector<Captured> messages_;
    gr8_log_level saved_level_ = GR8_LOG_INFO;
};

// ─────────────────────────────────────────────────────────────────────────────
// Delivery and filtering
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(LoggingTest, CallbackReceivesFormattedMessage) {
    GR8_LOG_INFO("ROM", "loaded %d bytes", 132);
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].level, GR8_LOG_INFO);
    EXPECT_EQ(messages_[0].subsystem, "ROM");
    EXPECT_EQ(messages_[0].message, "loaded 132 bytes");
}

TEST_F(LoggingTest, LevelsBelowThresholdAreDropped) {
    GR8_LOG_DEBUG("CPU", "hidden");
    GR8_LOG_WARN("CPU", "shown");
    GR8_LOG_ERROR("CPU", "shown too");
    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(messages_[0].level, GR8_LOG_WARN);
    EXPECT_EQ(messages_[1].level, GR8_LOG_ERROR);
}

TEST_F(LoggingTest, TraceArgumentsAreNotEvaluatedWhenDisabled) {
    int evaluated = 0;
    auto touch = [&evaluated]() { return ++evaluated; };
    GR8_LOG_TRACE("CPU", "%d", touch());
    EXPECT_EQ(evaluated, 0);

    gr8_set_log_level(GR8_LOG_TRACE);
    GR8_LOG_TRACE("CPU", "%d", touch());
    EXPECT_EQ(evaluated, 1);
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].message, "1");
}

TEST_F(LoggingTest, EnabledMacroFollowsLevel) {
    EXPECT_TRUE(GR8_LOG_ENABLED(Info));
    EXPECT_FALSE(GR8_LOG_ENABLED(Debug));
    gr8_set_log_level(GR8_LOG_DEBUG);
    EXPECT_TRUE(GR8_LOG_ENABLED(Debug));
}

TEST_F(LoggingTest, RawMessageIsPassedThrough) {
    const std::string text = "exactly this";
    GR8_LOG_RAW(Warn, "RUN", std::string_view(text).substr(0, 7));
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].message, "exactly");
}

TEST_F(LoggingTest, OverlongMessagesAreTruncatedWithEllipsis) {
    const std::string big(3000, 'x');
    GR8_LOG_ERROR("RUN", "%s", big.c_str());
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].message.size(), 1023u);
    EXPECT_EQ(messages_[0].message.substr(1020), "...");
}

// ─────────────────────────────────────────────────────────────────────────────
// Level names
// ─────────────────────────────────────────────────────────────────────────────

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(gr8_log_level_name(GR8_LOG_ERROR), "ERROR");
    EXPECT_STREQ(gr8_log_level_name(GR8_LOG_TRACE), "TRACE");
    EXPECT_STREQ(log_level_name(LogLevel::Warn), "WARN");
}

TEST(LogLevelTest, Parse) {
    LogLevel level = LogLevel::Error;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::Trace);
}
