#include "core/RateLimit.hpp"
#include "core/TransferState.hpp"
#include "utils/Format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace {

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

// Accepts "", "b", "k", "kb", "kib" and the same for m and g.
bool ParseUnitSuffix(const std::string& suffix, RateUnit default_unit, RateUnit& unit) {
    if (suffix.empty()) {
        unit = default_unit;
        return true;
    }
    if (suffix == "b") {
        unit = RateUnit::kBytes;
        return true;
    }

    RateUnit candidate;
    switch (suffix[0]) {
        case 'k':
            candidate = RateUnit::kKibibytes;
            break;
        case 'm':
            candidate = RateUnit::kMebibytes;
            break;
        case 'g':
            candidate = RateUnit::kGibibytes;
            break;
        default:
            return false;
    }

    std::string rest = suffix.substr(1);
    if (rest.empty() || rest == "b" || rest == "ib") {
        unit = candidate;
        return true;
    }
    return false;
}

// Splits "1.5 MiB" into its numeric prefix and lowercased unit suffix.
bool SplitQuantity(const std::string& text, double& value, std::string& suffix) {
    if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '.')) {
        return false;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(value) || value < 0.0) {
        return false;
    }

    suffix = ToLower(Trim(std::string(end)));
    return true;
}

} // namespace

uint64_t UnitMultiplier(RateUnit unit) {
    switch (unit) {
        case RateUnit::kKibibytes:
            return uint64_t{1} << 10;
        case RateUnit::kMebibytes:
            return uint64_t{1} << 20;
        case RateUnit::kGibibytes:
            return uint64_t{1} << 30;
        case RateUnit::kBytes:
        default:
            return 1;
    }
}

RateUnit NextUnit(RateUnit unit) {
    switch (unit) {
        case RateUnit::kBytes:
            return RateUnit::kKibibytes;
        case RateUnit::kKibibytes:
            return RateUnit::kMebibytes;
        case RateUnit::kMebibytes:
            return RateUnit::kGibibytes;
        case RateUnit::kGibibytes:
        default:
            return RateUnit::kBytes;
    }
}

std::string UnitSuffix(RateUnit unit) {
    switch (unit) {
        case RateUnit::kKibibytes:
            return "KiB/s";
        case RateUnit::kMebibytes:
            return "MiB/s";
        case RateUnit::kGibibytes:
            return "GiB/s";
        case RateUnit::kBytes:
        default:
            return "B/s";
    }
}

double RateLimit::BytesPerSecond() const {
    return magnitude * static_cast<double>(UnitMultiplier(unit));
}

bool RateLimit::IsEffectivelyUnlimited() const {
    return unlimited || BytesPerSecond() >= kUnlimitedBytesPerSecond;
}

bool RateLimit::IsStalled() const {
    if (paused) {
        return true;
    }
    return !IsEffectivelyUnlimited() && BytesPerSecond() <= 0.0;
}

std::string RateLimit::Describe() const {
    std::string description;
    if (unlimited) {
        description = "unlimited";
    } else {
        description = utils::FormatMagnitude(magnitude) + " " + UnitSuffix(unit);
    }
    if (paused) {
        description += " (paused)";
    }
    return description;
}

RateLimit RateLimit::Unlimited() {
    return RateLimit{};
}

RateLimit RateLimit::Limited(double magnitude, RateUnit unit) {
    RateLimit limit;
    limit.magnitude = magnitude;
    limit.unit = unit;
    limit.unlimited = false;
    return limit;
}

RateLimit ParseRateLimit(const std::string& text, RateUnit default_unit) {
    std::string trimmed = Trim(text);
    std::string lowered = ToLower(trimmed);

    if (lowered.size() >= 2 && lowered.compare(lowered.size() - 2, 2, "/s") == 0) {
        lowered = Trim(lowered.substr(0, lowered.size() - 2));
    }

    double value = 0.0;
    std::string suffix;
    RateUnit unit = default_unit;
    if (!SplitQuantity(lowered, value, suffix) || !ParseUnitSuffix(suffix, default_unit, unit)) {
        throw TransferError(ErrorKind::kInvalidRateInput, "invalid rate '" + trimmed + "'");
    }

    return RateLimit::Limited(value, unit);
}

uint64_t ParseByteSize(const std::string& text) {
    std::string trimmed = Trim(text);
    double value = 0.0;
    std::string suffix;
    RateUnit unit = RateUnit::kBytes;
    if (!SplitQuantity(ToLower(trimmed), value, suffix) ||
        !ParseUnitSuffix(suffix, RateUnit::kBytes, unit)) {
        throw std::invalid_argument("invalid size '" + trimmed + "'");
    }

    double bytes = value * static_cast<double>(UnitMultiplier(unit));
    if (bytes >= 9.0e18) {
        throw std::invalid_argument("size out of range '" + trimmed + "'");
    }
    return static_cast<uint64_t>(std::llround(bytes));
}
