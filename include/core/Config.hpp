#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "core/RateLimit.hpp"

struct Config {
    RateLimit initial_limit = RateLimit::Unlimited();
    std::optional<uint64_t> total_size_hint;
    bool interactive = true;
    bool show_help = false;
    // Where the interactive screen is drawn and keys are read.
    std::string terminal_device = "/dev/tty";
};

// Throws std::invalid_argument on unknown options or malformed values.
Config ParseCommandLine(const std::vector<std::string>& args);
Config ParseCommandLine(int argc, char* argv[]);

void PrintUsage(std::ostream& out, const std::string& program_name);
