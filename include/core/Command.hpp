#pragma once

#include <string>
#include <variant>

#include "core/RateLimit.hpp"

struct PauseCommand {};

struct ResumeCommand {};

struct SetRateCommand {
    double magnitude;
    RateUnit unit;
};

// Shifts the magnitude by delta steps of the current unit, never below zero.
struct NudgeCommand {
    double delta;
};

// Moves to the next unit, keeping the magnitude the engine holds when applied.
struct CycleUnitCommand {};

// Switches between the configured limit and no limit at all.
struct ToggleLimitCommand {};

struct QuitCommand {};

using Command = std::variant<PauseCommand,
                             ResumeCommand,
                             SetRateCommand,
                             NudgeCommand,
                             CycleUnitCommand,
                             ToggleLimitCommand,
                             QuitCommand>;

std::string DescribeCommand(const Command& command);

// Helper for std::visit with a set of lambdas.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
