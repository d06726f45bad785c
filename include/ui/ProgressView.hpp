#pragma once

#include <string>

#include "core/CopyEngine.hpp"
#include "core/ProgressTracker.hpp"

// Observed rate counts as saturated when it has reached the limit or sits
// within 10% (or 1 byte/s) of it.
bool IsRateSaturated(double observed_bytes_per_second, const RateLimit& limit);

std::string ProgressBar(double ratio, int width);
std::string TargetRateText(const RateLimit& limit);
std::string TransferredText(const TransferSnapshot& snapshot);

// One-line account of a run, logged when the session ends.
std::string SummaryLine(const TransferSnapshot& snapshot, const EngineStatus& status);
