#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

#include "core/RateLimit.hpp"
#include "utils/Clock.hpp"

constexpr size_t kMaxChunkSize = 64 * 1024;

// Invoked whenever admission has to wait. std::nullopt means "until something
// changes" (paused or zero rate). Returning false abandons the acquisition.
using SuspendFunction = std::function<bool(std::optional<std::chrono::nanoseconds>)>;

// Token bucket admission control. Owned and driven by a single thread, the
// copy engine; nothing here is synchronized.
class RateController {
public:
    explicit RateController(const RateLimit& limit,
                            utils::NowFunction now = utils::SteadyNow);

    // Blocks (through suspend) until bytes have been admitted and debited.
    // Requests larger than the bucket are admitted in capacity-sized portions.
    bool Acquire(size_t bytes, const SuspendFunction& suspend);

    // New refill rate for future refills. Accrued tokens are kept, clamped to
    // the new capacity. Also lifts an unlimited setting.
    void Configure(double magnitude, RateUnit unit);
    void SetUnlimited(bool unlimited);
    void Pause();
    // Restarts refill from now; the paused interval earns nothing.
    void Resume();

    const RateLimit& Limit() const { return limit_; }
    double AvailableBytes() const { return available_; }
    double CapacityBytes() const { return capacity_; }
    double RefillBytesPerSecond() const;

    // Read size matching roughly 100 ms of budget, within [1, kMaxChunkSize].
    size_t PreferredChunkSize() const;

private:
    void Refill(utils::TimePoint now);
    void Recalculate();

    RateLimit limit_;
    utils::NowFunction now_;
    double capacity_ = 0.0;
    double available_ = 0.0;
    utils::TimePoint last_refill_;
};
