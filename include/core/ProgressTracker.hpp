#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "utils/Clock.hpp"

struct TransferSnapshot {
    uint64_t bytes_transferred = 0;
    std::chrono::nanoseconds elapsed{0};
    double smoothed_rate = 0.0;
    std::optional<std::chrono::seconds> eta;
    std::optional<uint64_t> total_size_hint;

    // Fraction of the hinted size written so far, in [0, 1].
    std::optional<double> Ratio() const;
};

constexpr std::chrono::seconds kDefaultRateWindow{2};

// Cumulative and trailing-window throughput. Written by the copy engine,
// read by the UI; both sides hold the lock only for a copy.
class ProgressTracker {
public:
    explicit ProgressTracker(std::optional<uint64_t> total_size_hint = std::nullopt,
                             std::chrono::nanoseconds window = kDefaultRateWindow,
                             utils::NowFunction now = utils::SteadyNow);

    void Update(uint64_t bytes_just_written);
    TransferSnapshot Snapshot() const;

    uint64_t BytesTransferred() const;

private:
    void Prune(utils::TimePoint now) const;

    mutable std::mutex mutex_;
    utils::NowFunction now_;
    std::chrono::nanoseconds window_;
    std::optional<uint64_t> total_size_hint_;
    utils::TimePoint start_;
    uint64_t bytes_transferred_ = 0;
    mutable std::deque<std::pair<utils::TimePoint, uint64_t>> samples_;
};
