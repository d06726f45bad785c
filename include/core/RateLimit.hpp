#pragma once

#include <cstdint>
#include <string>

enum class RateUnit {
    kBytes,
    kKibibytes,
    kMebibytes,
    kGibibytes
};

// Effective rates above this are treated as unlimited (1 PiB/s).
constexpr double kUnlimitedBytesPerSecond = 1125899906842624.0;

uint64_t UnitMultiplier(RateUnit unit);
RateUnit NextUnit(RateUnit unit);
std::string UnitSuffix(RateUnit unit);

struct RateLimit {
    double magnitude = 0.0;
    RateUnit unit = RateUnit::kBytes;
    bool paused = false;
    bool unlimited = true;

    // Refill rate implied by magnitude and unit, ignoring pause.
    double BytesPerSecond() const;
    // True when admission never waits: no limit, or one too large to account for.
    bool IsEffectivelyUnlimited() const;
    // True when admission is suspended: paused, or a zero magnitude.
    bool IsStalled() const;

    std::string Describe() const;

    static RateLimit Unlimited();
    static RateLimit Limited(double magnitude, RateUnit unit);
};

// Parses "512K", "1.5MiB/s", "100", "2 g/s". A missing unit suffix means
// default_unit. Throws TransferError(kInvalidRateInput) on malformed input.
RateLimit ParseRateLimit(const std::string& text, RateUnit default_unit = RateUnit::kBytes);

// Parses a byte count with an optional binary suffix: "4096", "10M", "1GiB".
uint64_t ParseByteSize(const std::string& text);
