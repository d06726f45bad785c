/**
 * @file test_progress_tracker.cpp
 * @brief Cumulative counters, windowed rate and ETA
 */

#include "test_harness.hpp"

#include <atomic>
#include <thread>

#include "core/ProgressTracker.hpp"

using namespace std::chrono_literals;

TEST(empty_tracker_snapshot) {
    ManualClock clock;
    ProgressTracker tracker(std::nullopt, 2s, clock.Function());
    TransferSnapshot snapshot = tracker.Snapshot();
    ASSERT_EQ(snapshot.bytes_transferred, 0u);
    ASSERT_EQ(snapshot.smoothed_rate, 0.0);
    ASSERT(!snapshot.eta);
    ASSERT(!snapshot.Ratio());
}

TEST(single_update_uses_lifetime_average) {
    ManualClock clock;
    ProgressTracker tracker(std::nullopt, 2s, clock.Function());
    clock.Advance(1s);
    tracker.Update(1000);
    clock.Advance(1s);
    // Start sample plus one update: averaged over the whole two seconds.
    ASSERT_NEAR(tracker.Snapshot().smoothed_rate, 500.0, 1e-6);
}

TEST(window_forgets_old_throughput) {
    ManualClock clock;
    ProgressTracker tracker(std::nullopt, 2s, clock.Function());
    for (int i = 0; i < 10; ++i) {
        clock.Advance(100ms);
        tracker.Update(10000);
    }
    for (int i = 0; i < 40; ++i) {
        clock.Advance(100ms);
        tracker.Update(100);
    }
    ASSERT_NEAR(tracker.Snapshot().smoothed_rate, 1000.0, 1e-6);
    ASSERT_EQ(tracker.BytesTransferred(), 104000u);
}

TEST(rate_decays_while_stalled) {
    ManualClock clock;
    ProgressTracker tracker(std::nullopt, 2s, clock.Function());
    for (int i = 0; i < 20; ++i) {
        clock.Advance(100ms);
        tracker.Update(1000);
    }
    ASSERT_NEAR(tracker.Snapshot().smoothed_rate, 10000.0, 1e-6);

    clock.Advance(1s);
    ASSERT_NEAR(tracker.Snapshot().smoothed_rate, 5000.0, 1e-6);

    clock.Advance(10s);
    ASSERT_EQ(tracker.Snapshot().smoothed_rate, 0.0);
}

TEST(eta_from_size_hint) {
    ManualClock clock;
    ProgressTracker tracker(uint64_t{10000}, 2s, clock.Function());
    clock.Advance(1s);
    tracker.Update(1000);

    TransferSnapshot snapshot = tracker.Snapshot();
    ASSERT(snapshot.eta.has_value());
    ASSERT_EQ(snapshot.eta->count(), 9);
    ASSERT_NEAR(*snapshot.Ratio(), 0.1, 1e-9);
}

TEST(eta_undefined_without_rate) {
    ManualClock clock;
    ProgressTracker tracker(uint64_t{10000}, 2s, clock.Function());
    ASSERT(!tracker.Snapshot().eta);
}

TEST(eta_undefined_when_rate_is_negligible) {
    ManualClock clock;
    ProgressTracker tracker(uint64_t{1} << 40, 2s, clock.Function());
    clock.Advance(std::chrono::hours(24 * 365));
    tracker.Update(1);

    TransferSnapshot snapshot = tracker.Snapshot();
    ASSERT_GT(snapshot.smoothed_rate, 0.0);
    ASSERT(!snapshot.eta);
}

TEST(eta_zero_once_hint_reached) {
    ManualClock clock;
    ProgressTracker tracker(uint64_t{100}, 2s, clock.Function());
    clock.Advance(1s);
    tracker.Update(150);
    TransferSnapshot snapshot = tracker.Snapshot();
    ASSERT_EQ(snapshot.eta->count(), 0);
    ASSERT_EQ(*snapshot.Ratio(), 1.0);
}

TEST(concurrent_reader_sees_monotonic_counts) {
    ProgressTracker tracker;
    std::atomic<bool> done{false};
    bool monotonic = true;

    std::thread reader([&] {
        uint64_t last = 0;
        while (!done) {
            uint64_t current = tracker.Snapshot().bytes_transferred;
            if (current < last) {
                monotonic = false;
            }
            last = current;
        }
    });

    for (int i = 0; i < 100000; ++i) {
        tracker.Update(3);
    }
    done = true;
    reader.join();

    ASSERT(monotonic);
    ASSERT_EQ(tracker.BytesTransferred(), 300000u);
}

int main() {
    printf("Running progress tracker tests...\n");

    RUN_TEST(empty_tracker_snapshot);
    RUN_TEST(single_update_uses_lifetime_average);
    RUN_TEST(window_forgets_old_throughput);
    RUN_TEST(rate_decays_while_stalled);
    RUN_TEST(eta_from_size_hint);
    RUN_TEST(eta_undefined_without_rate);
    RUN_TEST(eta_undefined_when_rate_is_negligible);
    RUN_TEST(eta_zero_once_hint_reached);
    RUN_TEST(concurrent_reader_sees_monotonic_counts);

    FINISH_TESTS();
}
