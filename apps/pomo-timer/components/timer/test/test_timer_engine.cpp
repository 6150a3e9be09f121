#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "support/log.h"
#include "test_support.h"
#include "timer/timer_engine.h"

namespace pomo {
namespace {

using test::CountingAlert;
using test::FakeClock;

class TimerEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_set_level(LogLevel::None);
        ASSERT_EQ(engine_.init(config_, clock_, &alert_), POMO_OK);
    }

    void TearDown() override { log_set_level(LogLevel::Info); }

    TimerEngineConfig config_{};
    FakeClock clock_;
    CountingAlert alert_;
    TimerEngine engine_;
};

TEST_F(TimerEngineTest, InitialSnapshotShowsInactiveWorkDuration) {
    const TimerSnapshot snapshot = engine_.latest_snapshot();
    EXPECT_EQ(snapshot.phase, TimerPhase::Inactive);
    EXPECT_EQ(snapshot.work_seconds, 25u * 60);
    EXPECT_EQ(snapshot.rest_seconds, 5u * 60);
    EXPECT_EQ(snapshot.remaining_ms, 25u * 60 * 1000);
    EXPECT_EQ(snapshot.phase_total_ms, 25u * 60 * 1000);
    EXPECT_EQ(snapshot.flip_count, 0u);
}

TEST_F(TimerEngineTest, CommandsApplyOnPollInOrder) {
    EXPECT_TRUE(engine_.enqueue_control(ControlCommand::Start));
    EXPECT_EQ(engine_.latest_snapshot().phase, TimerPhase::Inactive);

    TimerSnapshot snapshot = engine_.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Working);

    clock_.advance_minutes(10);
    engine_.enqueue_control(ControlCommand::Stop);
    engine_.enqueue_control(ControlCommand::IncreaseDuration);
    snapshot = engine_.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Paused);
    EXPECT_EQ(snapshot.paused_phase, TimerPhase::Working);
    EXPECT_EQ(snapshot.work_seconds, 30u * 60);
    EXPECT_EQ(snapshot.remaining_ms, 20u * 60 * 1000);

    clock_.advance_minutes(3);
    engine_.enqueue_control(ControlCommand::Resume);
    snapshot = engine_.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Working);
    EXPECT_EQ(snapshot.remaining_ms, 20u * 60 * 1000);
}

TEST_F(TimerEngineTest, PollFlipsExpiredPhaseAndForwardsAlert) {
    engine_.enqueue_control(ControlCommand::Start);
    engine_.poll();

    clock_.advance_minutes(25);
    TimerSnapshot snapshot = engine_.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Resting);
    EXPECT_EQ(snapshot.remaining_ms, 5u * 60 * 1000);
    EXPECT_EQ(snapshot.phase_total_ms, 5u * 60 * 1000);
    EXPECT_EQ(snapshot.flip_count, 1u);
    EXPECT_EQ(alert_.count, 1);

    snapshot = engine_.poll();
    EXPECT_EQ(snapshot.flip_count, 1u);
    EXPECT_EQ(alert_.count, 1);
}

TEST_F(TimerEngineTest, FlipCommandCountsAsFlip) {
    engine_.enqueue_control(ControlCommand::Flip);
    engine_.enqueue_control(ControlCommand::Flip);
    const TimerSnapshot snapshot = engine_.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Resting);
    EXPECT_EQ(snapshot.flip_count, 2u);
    EXPECT_EQ(alert_.count, 2);
}

TEST_F(TimerEngineTest, ResetAndTogglePause) {
    engine_.enqueue_control(ControlCommand::TogglePause);
    EXPECT_EQ(engine_.poll().phase, TimerPhase::Working);
    engine_.enqueue_control(ControlCommand::TogglePause);
    EXPECT_EQ(engine_.poll().phase, TimerPhase::Paused);
    engine_.enqueue_control(ControlCommand::Reset);
    const TimerSnapshot snapshot = engine_.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Inactive);
    EXPECT_EQ(snapshot.paused_phase, TimerPhase::Inactive);
}

TEST_F(TimerEngineTest, DecreaseUsesAdjustStepAndFloor) {
    for (int i = 0; i < 10; ++i) {
        engine_.enqueue_control(ControlCommand::DecreaseDuration);
    }
    const TimerSnapshot snapshot = engine_.poll();
    EXPECT_EQ(snapshot.work_seconds, 5u * 60);
    EXPECT_EQ(snapshot.rest_seconds, 60u);
}

TEST_F(TimerEngineTest, RejectsNoneAndFullQueue) {
    EXPECT_FALSE(engine_.enqueue_control(ControlCommand::None));
    for (uint32_t i = 0; i < config_.command_queue_depth; ++i) {
        EXPECT_TRUE(engine_.enqueue_control(ControlCommand::IncreaseDuration));
    }
    EXPECT_FALSE(engine_.enqueue_control(ControlCommand::IncreaseDuration));

    const TimerSnapshot snapshot = engine_.poll();
    EXPECT_EQ(snapshot.work_seconds, (25u + 5u * config_.command_queue_depth) * 60);
    EXPECT_TRUE(engine_.enqueue_control(ControlCommand::Start));
}

TEST_F(TimerEngineTest, AutoStartBeginsWorking) {
    TimerEngine engine;
    TimerEngineConfig config{};
    config.auto_start = true;
    config.work_seconds = 50 * 60;
    ASSERT_EQ(engine.init(config, clock_), POMO_OK);
    const TimerSnapshot snapshot = engine.latest_snapshot();
    EXPECT_EQ(snapshot.phase, TimerPhase::Working);
    EXPECT_EQ(snapshot.rest_seconds, 10u * 60);
}

TEST_F(TimerEngineTest, InvalidConfigIsRejected) {
    TimerEngine engine;
    TimerEngineConfig config{};
    config.command_queue_depth = 0;
    EXPECT_EQ(engine.init(config, clock_), POMO_ERR_INVALID_ARG);

    config = TimerEngineConfig{};
    config.adjust_step_seconds = 0;
    EXPECT_EQ(engine.init(config, clock_), POMO_ERR_INVALID_ARG);
}

TEST(TimerEngineUninitialisedTest, DropsCommandsAndPollsSafely) {
    log_set_level(LogLevel::None);
    TimerEngine engine;
    EXPECT_FALSE(engine.enqueue_control(ControlCommand::Start));
    const TimerSnapshot snapshot = engine.poll();
    EXPECT_EQ(snapshot.phase, TimerPhase::Inactive);
    log_set_level(LogLevel::Info);
}

TEST(TimerEngineThreadingTest, ConcurrentProducersAreSerialised) {
    log_set_level(LogLevel::None);
    FakeClock clock;
    TimerEngine engine;
    TimerEngineConfig config{};
    config.command_queue_depth = 1024;
    ASSERT_EQ(engine.init(config, clock), POMO_OK);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t) {
        producers.emplace_back([&engine]() {
            for (int i = 0; i < kPerThread; ++i) {
                engine.enqueue_control(ControlCommand::IncreaseDuration);
            }
        });
    }
    for (std::thread& producer : producers) {
        producer.join();
    }

    const TimerSnapshot snapshot = engine.poll();
    EXPECT_EQ(snapshot.work_seconds, (25u + 5u * kThreads * kPerThread) * 60);
    EXPECT_EQ(snapshot.rest_seconds, snapshot.work_seconds / 5);
    log_set_level(LogLevel::Info);
}

}  // namespace
}  // namespace pomo
