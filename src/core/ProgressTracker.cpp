#include "core/ProgressTracker.hpp"

#include <algorithm>
#include <cmath>

namespace {
// Estimates beyond this are reported as unknown.
constexpr double kMaxEtaSeconds = 100.0 * 365 * 24 * 3600;
}

std::optional<double> TransferSnapshot::Ratio() const {
    if (!total_size_hint) {
        return std::nullopt;
    }
    if (*total_size_hint == 0) {
        return 1.0;
    }
    return std::min(1.0, static_cast<double>(bytes_transferred) /
                         static_cast<double>(*total_size_hint));
}

ProgressTracker::ProgressTracker(std::optional<uint64_t> total_size_hint,
                                 std::chrono::nanoseconds window,
                                 utils::NowFunction now) :
    now_(std::move(now)),
    window_(window),
    total_size_hint_(total_size_hint)
{
    start_ = now_();
    samples_.emplace_back(start_, 0);
}

// Keeps the newest sample at or before the window start as the anchor, so the
// rate covers the whole window and decays while nothing is written.
void ProgressTracker::Prune(utils::TimePoint now) const {
    auto window_start = now - window_;
    while (samples_.size() >= 2 && samples_[1].first <= window_start) {
        samples_.pop_front();
    }
}

void ProgressTracker::Update(uint64_t bytes_just_written) {
    auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_transferred_ += bytes_just_written;
    samples_.emplace_back(now, bytes_transferred_);
    Prune(now);
}

uint64_t ProgressTracker::BytesTransferred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_transferred_;
}

TransferSnapshot ProgressTracker::Snapshot() const {
    auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    Prune(now);

    TransferSnapshot snapshot;
    snapshot.bytes_transferred = bytes_transferred_;
    snapshot.elapsed = std::max(std::chrono::nanoseconds(0), now - start_);
    snapshot.total_size_hint = total_size_hint_;

    const auto& anchor = samples_.front();
    bool anchor_is_stale = anchor.first <= now - window_;
    if (samples_.size() >= 2 || anchor_is_stale) {
        double span = std::chrono::duration<double>(now - anchor.first).count();
        if (span > 0.0) {
            snapshot.smoothed_rate = static_cast<double>(bytes_transferred_ - anchor.second) / span;
        }
    } else {
        double lifetime = std::chrono::duration<double>(snapshot.elapsed).count();
        if (lifetime > 0.0) {
            snapshot.smoothed_rate = static_cast<double>(bytes_transferred_) / lifetime;
        }
    }

    if (total_size_hint_) {
        if (bytes_transferred_ >= *total_size_hint_) {
            snapshot.eta = std::chrono::seconds(0);
        } else if (snapshot.smoothed_rate > 0.0) {
            double remaining = static_cast<double>(*total_size_hint_ - bytes_transferred_);
            double seconds = std::ceil(remaining / snapshot.smoothed_rate);
            if (seconds <= kMaxEtaSeconds) {
                snapshot.eta = std::chrono::seconds(static_cast<int64_t>(seconds));
            }
        }
    }
    return snapshot;
}
