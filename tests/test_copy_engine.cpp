/**
 * @file test_copy_engine.cpp
 * @brief Copy loop: byte fidelity, failures, cancellation and live commands
 */

#include "test_harness.hpp"

#include <future>
#include <thread>

#include "core/CopyEngine.hpp"

using namespace std::chrono_literals;

namespace {

// Everything one engine run needs, wired the way Session wires it.
struct EngineRig {
    explicit EngineRig(std::vector<char> data, RateLimit limit = RateLimit::Unlimited(),
                       size_t read_fail_after = SIZE_MAX, size_t write_fail_after = SIZE_MAX)
        : source(std::move(data), read_fail_after),
          sink(write_fail_after),
          engine(source, sink, commands, tracker, status, log, limit) {}

    MemorySource source;
    MemorySink sink;
    CommandChannel commands;
    ProgressTracker tracker;
    utils::SharedSlot<EngineStatus> status;
    utils::ActivityLog log;
    CopyEngine engine;
};

template <typename Predicate>
bool WaitUntil(Predicate predicate, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST(copies_input_unchanged) {
    auto data = MakePattern(1024 * 1024 + 17);
    EngineRig rig{data};

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kCompleted);
    ASSERT_EQ(outcome.ExitCode(), kExitCompleted);
    ASSERT_EQ(outcome.bytes_transferred, data.size());
    ASSERT(rig.sink.Data() == data);
    ASSERT_EQ(rig.sink.Flushes(), 1);
    ASSERT(rig.status.Get().state == TransferState::kCompleted);
}

TEST(empty_input_completes) {
    EngineRig rig{std::vector<char>()};

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kCompleted);
    ASSERT_EQ(outcome.bytes_transferred, 0u);
    ASSERT_EQ(rig.sink.Size(), 0u);
}

TEST(read_error_fails_transfer) {
    auto data = MakePattern(300000);
    EngineRig rig{data, RateLimit::Unlimited(), 100000};

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kFailed);
    ASSERT(outcome.error == ErrorKind::kReadError);
    ASSERT_EQ(outcome.ExitCode(), kExitFailed);
    ASSERT_EQ(outcome.bytes_transferred, 100000u);

    auto written = rig.sink.Data();
    ASSERT(std::equal(written.begin(), written.end(), data.begin()));

    EngineStatus status = rig.status.Get();
    ASSERT(status.state == TransferState::kFailed);
    ASSERT(status.error == ErrorKind::kReadError);
    ASSERT(!status.error_message.empty());
}

TEST(write_error_fails_transfer) {
    auto data = MakePattern(500000);
    EngineRig rig{data, RateLimit::Unlimited(), SIZE_MAX, 200000};

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kFailed);
    ASSERT(outcome.error == ErrorKind::kWriteError);
    ASSERT_EQ(outcome.ExitCode(), kExitFailed);
    ASSERT_LE(outcome.bytes_transferred, 200000u);
    ASSERT_EQ(outcome.bytes_transferred, rig.sink.Size());
    ASSERT(outcome.message.find("Broken pipe") != std::string::npos);
}

TEST(flush_error_after_drain_fails_transfer) {
    auto data = MakePattern(100000);
    EngineRig rig{data};
    rig.sink.FailOnFlush();

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kFailed);
    ASSERT(outcome.error == ErrorKind::kWriteError);
    ASSERT_EQ(outcome.ExitCode(), kExitFailed);
    // Everything was written before the final flush failed.
    ASSERT(rig.sink.Data() == data);
    ASSERT_EQ(rig.sink.Flushes(), 1);

    EngineStatus status = rig.status.Get();
    ASSERT(status.state == TransferState::kFailed);
    ASSERT(status.error_message.find("Flush error") != std::string::npos);
}

TEST(quit_before_first_chunk_cancels) {
    EngineRig rig{MakePattern(4096)};
    rig.commands.Push(QuitCommand{});

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kCancelled);
    ASSERT_EQ(outcome.ExitCode(), kExitCancelled);
    ASSERT_EQ(rig.sink.Size(), 0u);
}

TEST(pause_holds_until_resume) {
    auto data = MakePattern(256 * 1024);
    RateLimit limit = RateLimit::Unlimited();
    limit.paused = true;
    EngineRig rig{data, limit};
    ASSERT(rig.engine.State() == TransferState::kPaused);

    auto result = std::async(std::launch::async, [&rig] { return rig.engine.Run(); });

    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(rig.sink.Size(), 0u);
    ASSERT(rig.status.Get().state == TransferState::kPaused);

    rig.commands.Push(ResumeCommand{});
    ASSERT(result.wait_for(5s) == std::future_status::ready);

    ExitOutcome outcome = result.get();
    ASSERT(outcome.state == TransferState::kCompleted);
    ASSERT(rig.sink.Data() == data);
}

TEST(quit_while_paused_cancels) {
    RateLimit limit = RateLimit::Limited(1.0, RateUnit::kMebibytes);
    limit.paused = true;
    EngineRig rig{MakePattern(64 * 1024), limit};

    auto result = std::async(std::launch::async, [&rig] { return rig.engine.Run(); });
    std::this_thread::sleep_for(50ms);
    rig.commands.Push(QuitCommand{});

    ASSERT(result.wait_for(5s) == std::future_status::ready);
    ExitOutcome outcome = result.get();
    ASSERT(outcome.state == TransferState::kCancelled);
    ASSERT_EQ(rig.sink.Size(), 0u);
}

TEST(last_rate_change_wins) {
    EngineRig rig{MakePattern(1000)};
    rig.commands.Push(SetRateCommand{500.0, RateUnit::kKibibytes});
    rig.commands.Push(SetRateCommand{8.0, RateUnit::kMebibytes});

    ExitOutcome outcome = rig.engine.Run();
    ASSERT(outcome.state == TransferState::kCompleted);

    RateLimit limit = rig.status.Get().limit;
    ASSERT(!limit.unlimited);
    ASSERT_EQ(limit.magnitude, 8.0);
    ASSERT(limit.unit == RateUnit::kMebibytes);
}

TEST(nudge_never_goes_negative) {
    EngineRig rig{std::vector<char>(), RateLimit::Limited(3.0, RateUnit::kMebibytes)};
    rig.commands.Push(NudgeCommand{-10.0});
    rig.commands.Push(NudgeCommand{1.0});

    rig.engine.Run();
    RateLimit limit = rig.status.Get().limit;
    ASSERT_EQ(limit.magnitude, 1.0);
    ASSERT(limit.unit == RateUnit::kMebibytes);
}

TEST(unit_cycle_keeps_queued_nudge) {
    EngineRig rig{std::vector<char>(), RateLimit::Limited(3.0, RateUnit::kKibibytes)};
    rig.commands.Push(NudgeCommand{1.0});
    rig.commands.Push(CycleUnitCommand{});

    rig.engine.Run();
    RateLimit limit = rig.status.Get().limit;
    ASSERT_EQ(limit.magnitude, 4.0);
    ASSERT(limit.unit == RateUnit::kMebibytes);

    EngineRig wrap{std::vector<char>(), RateLimit::Limited(2.0, RateUnit::kGibibytes)};
    wrap.commands.Push(CycleUnitCommand{});
    wrap.engine.Run();
    ASSERT(wrap.status.Get().limit.unit == RateUnit::kBytes);
}

TEST(toggle_limit_switches_unlimited) {
    EngineRig rig{std::vector<char>(), RateLimit::Limited(2.0, RateUnit::kKibibytes)};
    rig.commands.Push(ToggleLimitCommand{});

    rig.engine.Run();
    RateLimit limit = rig.status.Get().limit;
    ASSERT(limit.unlimited);
    ASSERT_EQ(limit.magnitude, 2.0);
}

TEST(rate_limit_slows_copy) {
    auto data = MakePattern(200 * 1024);
    EngineRig rig{data, RateLimit::Limited(1.0, RateUnit::kMebibytes)};

    auto start = std::chrono::steady_clock::now();
    ExitOutcome outcome = rig.engine.Run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT(outcome.state == TransferState::kCompleted);
    ASSERT(rig.sink.Data() == data);
    // 200 KiB at 1 MiB/s from an empty bucket takes about 195 ms.
    ASSERT_GE(elapsed, 150ms);
    ASSERT_LE(elapsed, 3s);
}

TEST(zero_rate_stalls_until_raised) {
    auto data = MakePattern(4096);
    EngineRig rig{data, RateLimit::Limited(0.0, RateUnit::kKibibytes)};

    auto result = std::async(std::launch::async, [&rig] { return rig.engine.Run(); });
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(rig.sink.Size(), 0u);
    ASSERT(rig.status.Get().state == TransferState::kRunning);

    rig.commands.Push(SetRateCommand{64.0, RateUnit::kMebibytes});
    ASSERT(result.wait_for(5s) == std::future_status::ready);
    ASSERT(result.get().state == TransferState::kCompleted);
    ASSERT(rig.sink.Data() == data);
}

TEST(progress_visible_while_running) {
    auto data = MakePattern(512 * 1024);
    EngineRig rig{data, RateLimit::Limited(1.0, RateUnit::kMebibytes)};

    auto result = std::async(std::launch::async, [&rig] { return rig.engine.Run(); });
    ASSERT(WaitUntil([&rig] { return rig.tracker.BytesTransferred() > 0; }));
    ASSERT(rig.status.Get().state == TransferState::kRunning);

    rig.commands.Push(QuitCommand{});
    ASSERT(result.wait_for(5s) == std::future_status::ready);
    ExitOutcome outcome = result.get();
    ASSERT(outcome.state == TransferState::kCancelled);
    ASSERT_LE(outcome.bytes_transferred, data.size());
    ASSERT_EQ(outcome.bytes_transferred, rig.sink.Size());
}

TEST(activity_log_records_commands) {
    EngineRig rig{MakePattern(100)};
    rig.commands.Push(PauseCommand{});
    rig.commands.Push(ResumeCommand{});

    rig.engine.Run();
    auto messages = rig.log.GetMessages(50);
    bool saw_pause = false;
    bool saw_resume = false;
    for (const auto &message : messages) {
        saw_pause = saw_pause || message.find("Transfer paused") != std::string::npos;
        saw_resume = saw_resume || message.find("Transfer resumed") != std::string::npos;
    }
    ASSERT(saw_pause);
    ASSERT(saw_resume);
}

int main() {
    printf("Running copy engine tests...\n");

    RUN_TEST(copies_input_unchanged);
    RUN_TEST(empty_input_completes);
    RUN_TEST(read_error_fails_transfer);
    RUN_TEST(write_error_fails_transfer);
    RUN_TEST(flush_error_after_drain_fails_transfer);
    RUN_TEST(quit_before_first_chunk_cancels);
    RUN_TEST(pause_holds_until_resume);
    RUN_TEST(quit_while_paused_cancels);
    RUN_TEST(last_rate_change_wins);
    RUN_TEST(nudge_never_goes_negative);
    RUN_TEST(unit_cycle_keeps_queued_nudge);
    RUN_TEST(toggle_limit_switches_unlimited);
    RUN_TEST(rate_limit_slows_copy);
    RUN_TEST(zero_rate_stalls_until_raised);
    RUN_TEST(progress_visible_while_running);
    RUN_TEST(activity_log_records_commands);

    FINISH_TESTS();
}
