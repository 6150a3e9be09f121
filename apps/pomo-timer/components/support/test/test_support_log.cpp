#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "support/err.h"
#include "support/log.h"

namespace pomo {
namespace {

class LogCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        stream_ = std::tmpfile();
        ASSERT_NE(stream_, nullptr);
        log_set_output(stream_);
        previous_ = log_get_level();
    }

    void TearDown() override {
        log_set_output(nullptr);
        log_set_level(previous_);
        std::fclose(stream_);
    }

    std::string captured() {
        std::fflush(stream_);
        std::rewind(stream_);
        std::string text;
        char chunk[256];
        size_t n = 0;
        while ((n = std::fread(chunk, 1, sizeof(chunk), stream_)) > 0) {
            text.append(chunk, n);
        }
        return text;
    }

    std::FILE* stream_ = nullptr;
    LogLevel previous_ = LogLevel::Info;
};

TEST_F(LogCaptureTest, WritesLevelTagAndMessage) {
    log_set_level(LogLevel::Info);
    POMO_LOGW("Tag", "value %d", 7);
    const std::string text = captured();
    EXPECT_EQ(text.rfind("W (", 0), 0u);
    EXPECT_NE(text.find(") Tag: value 7\n"), std::string::npos);
}

TEST_F(LogCaptureTest, FiltersBelowConfiguredLevel) {
    log_set_level(LogLevel::Warn);
    POMO_LOGI("Tag", "hidden");
    POMO_LOGD("Tag", "hidden");
    POMO_LOGE("Tag", "shown");
    const std::string text = captured();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown"), std::string::npos);
}

TEST_F(LogCaptureTest, NoneSilencesEverything) {
    log_set_level(LogLevel::None);
    POMO_LOGE("Tag", "nothing");
    EXPECT_TRUE(captured().empty());
}

pomo_err_t failing_step() {
    return POMO_ERR_INVALID_STATE;
}

pomo_err_t run_steps() {
    POMO_RETURN_ON_ERROR(failing_step(), "Steps", "step failed");
    return POMO_OK;
}

TEST_F(LogCaptureTest, ReturnOnErrorLogsAndPropagates) {
    log_set_level(LogLevel::Error);
    EXPECT_EQ(run_steps(), POMO_ERR_INVALID_STATE);
    EXPECT_NE(captured().find("Steps: step failed (POMO_ERR_INVALID_STATE)"), std::string::npos);
}

TEST(LogLevelTest, ParsesNamesWithFallback) {
    EXPECT_EQ(log_level_from_string("debug", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(log_level_from_string("none", LogLevel::Info), LogLevel::None);
    EXPECT_EQ(log_level_from_string("loud", LogLevel::Warn), LogLevel::Warn);
    EXPECT_EQ(log_level_from_string(nullptr, LogLevel::Error), LogLevel::Error);
}

TEST(ErrNameTest, NamesKnownCodes) {
    EXPECT_STREQ(pomo_err_to_name(POMO_OK), "POMO_OK");
    EXPECT_STREQ(pomo_err_to_name(POMO_ERR_INVALID_ARG), "POMO_ERR_INVALID_ARG");
    EXPECT_STREQ(pomo_err_to_name(1234), "POMO_ERR_UNKNOWN");
}

}  // namespace
}  // namespace pomo
