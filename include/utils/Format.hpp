#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace utils {
    std::string FormatBytes(uint64_t bytes);
    std::string FormatRate(double bytes_per_second);
    std::string FormatDuration(std::chrono::seconds duration);
    std::string FormatEta(const std::optional<std::chrono::seconds>& eta);
    std::string FormatMagnitude(double value);
}
