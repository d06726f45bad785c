#include "utils/Format.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

std::string utils::FormatBytes(uint64_t bytes) {
    const std::vector<std::string> units = { "B", "KiB", "MiB", "GiB", "TiB" };
    size_t unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < units.size() - 1) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    }
    return oss.str();
}

std::string utils::FormatRate(double bytes_per_second) {
    if (!(bytes_per_second > 0.0)) {
        return "0 B/s";
    }
    return FormatBytes(static_cast<uint64_t>(std::llround(bytes_per_second))) + "/s";
}

std::string utils::FormatDuration(std::chrono::seconds duration) {
    if (duration.count() < 0) {
        duration = std::chrono::seconds(0);
    }
    auto secs = duration.count();
    auto hours = secs / 3600;
    auto minutes = (secs / 60) % 60;
    auto seconds = secs % 60;

    std::ostringstream oss;
    oss << hours << ":"
        << std::setfill('0') << std::setw(2) << minutes << ":"
        << std::setfill('0') << std::setw(2) << seconds;
    return oss.str();
}

std::string utils::FormatEta(const std::optional<std::chrono::seconds>& eta) {
    if (!eta) {
        return "--:--:--";
    }
    return FormatDuration(*eta);
}

// Trims trailing zeros so 1.50 reads as 1.5 and 2.00 as 2.
std::string utils::FormatMagnitude(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    std::string text = oss.str();
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}
