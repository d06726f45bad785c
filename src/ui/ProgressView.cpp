#include "ui/ProgressView.hpp"

#include <algorithm>
#include <cmath>

#include "utils/Format.hpp"

namespace {
constexpr double kRelativeTolerance = 0.1;
constexpr double kAbsoluteTolerance = 1.0;
}

bool IsRateSaturated(double observed_bytes_per_second, const RateLimit& limit) {
    if (limit.IsEffectivelyUnlimited()) {
        return false;
    }
    double target = limit.BytesPerSecond();
    if (observed_bytes_per_second >= target) {
        return true;
    }
    double distance = std::abs(target - observed_bytes_per_second);
    return distance <= kAbsoluteTolerance || distance / target <= kRelativeTolerance;
}

std::string ProgressBar(double ratio, int width) {
    if (width <= 0) {
        return std::string();
    }
    ratio = std::clamp(ratio, 0.0, 1.0);
    int filled = static_cast<int>(ratio * width);
    return std::string(filled, '#') + std::string(width - filled, '.');
}

std::string TargetRateText(const RateLimit& limit) {
    if (limit.unlimited) {
        return "unlimited";
    }
    std::string text = utils::FormatMagnitude(limit.magnitude) + " " + UnitSuffix(limit.unit);
    if (limit.magnitude <= 0.0) {
        text += " (stalled)";
    }
    return text;
}

std::string TransferredText(const TransferSnapshot& snapshot) {
    std::string text = utils::FormatBytes(snapshot.bytes_transferred);
    if (snapshot.total_size_hint) {
        text += " / " + utils::FormatBytes(*snapshot.total_size_hint);
    }
    return text;
}

std::string SummaryLine(const TransferSnapshot& snapshot, const EngineStatus& status) {
    double seconds = std::chrono::duration<double>(snapshot.elapsed).count();
    double average = seconds > 0.0 ? static_cast<double>(snapshot.bytes_transferred) / seconds : 0.0;

    std::string line = TransferStateName(status.state) + ": " +
                       utils::FormatBytes(snapshot.bytes_transferred) + " in " +
                       utils::FormatDuration(std::chrono::duration_cast<std::chrono::seconds>(snapshot.elapsed)) +
                       " [" + utils::FormatRate(average) + "]";
    if (status.error) {
        line += " (" + ErrorKindName(*status.error);
        if (!status.error_message.empty()) {
            line += ": " + status.error_message;
        }
        line += ")";
    }
    return line;
}
