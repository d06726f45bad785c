#include "core/RateController.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {
// Absorbs floating point drift so a wait of exactly shortfall/rate suffices.
constexpr double kTokenEpsilon = 1e-6;
// Longest single suspension; tiny rates wait in several of these.
constexpr double kMaxAdmissionWaitSeconds = 1.0;
}

RateController::RateController(const RateLimit& limit, utils::NowFunction now) :
    limit_(limit),
    now_(std::move(now))
{
    last_refill_ = now_();
    Recalculate();
}

double RateController::RefillBytesPerSecond() const {
    if (limit_.paused || limit_.IsEffectivelyUnlimited()) {
        return 0.0;
    }
    return limit_.BytesPerSecond();
}

size_t RateController::PreferredChunkSize() const {
    double rate = limit_.BytesPerSecond();
    if (limit_.IsEffectivelyUnlimited() || rate <= 0.0) {
        return kMaxChunkSize;
    }
    double chunk = std::floor(rate / 10.0);
    return static_cast<size_t>(std::clamp(chunk, 1.0, static_cast<double>(kMaxChunkSize)));
}

void RateController::Recalculate() {
    double rate = limit_.BytesPerSecond();
    double chunk = static_cast<double>(PreferredChunkSize());
    if (limit_.IsEffectivelyUnlimited() || rate <= 0.0) {
        capacity_ = chunk;
    } else {
        capacity_ = std::max(rate, chunk);
    }
    available_ = std::min(available_, capacity_);
}

void RateController::Refill(utils::TimePoint now) {
    if (now > last_refill_) {
        double elapsed = std::chrono::duration<double>(now - last_refill_).count();
        double rate = RefillBytesPerSecond();
        if (rate > 0.0) {
            available_ = std::min(capacity_, available_ + elapsed * rate);
        }
    }
    last_refill_ = now;
}

bool RateController::Acquire(size_t bytes, const SuspendFunction& suspend) {
    size_t remaining = bytes;
    while (remaining > 0) {
        Refill(now_());

        if (limit_.IsStalled()) {
            if (!suspend(std::nullopt)) {
                return false;
            }
            continue;
        }
        if (limit_.IsEffectivelyUnlimited()) {
            return true;
        }

        size_t portion = std::min(remaining,
                                  std::max<size_t>(1, static_cast<size_t>(capacity_)));
        double needed = static_cast<double>(portion);
        if (available_ + kTokenEpsilon >= needed) {
            available_ = std::max(0.0, available_ - needed);
            remaining -= portion;
            continue;
        }

        double shortfall = needed - available_;
        double wait_seconds = std::min(shortfall / RefillBytesPerSecond(), kMaxAdmissionWaitSeconds);
        auto wait = std::chrono::ceil<std::chrono::nanoseconds>(
            std::chrono::duration<double>(wait_seconds));
        if (!suspend(wait)) {
            return false;
        }
    }
    return true;
}

void RateController::Configure(double magnitude, RateUnit unit) {
    Refill(now_());
    limit_.magnitude = std::max(0.0, magnitude);
    limit_.unit = unit;
    limit_.unlimited = false;
    Recalculate();
}

void RateController::SetUnlimited(bool unlimited) {
    Refill(now_());
    limit_.unlimited = unlimited;
    Recalculate();
}

void RateController::Pause() {
    Refill(now_());
    limit_.paused = true;
}

void RateController::Resume() {
    limit_.paused = false;
    last_refill_ = now_();
}
