#include "core/Command.hpp"

#include "utils/Format.hpp"

std::string DescribeCommand(const Command& command) {
    return std::visit(Overloaded{
        [](const PauseCommand&) -> std::string { return "pause"; },
        [](const ResumeCommand&) -> std::string { return "resume"; },
        [](const SetRateCommand& set) -> std::string {
            return "set rate " + utils::FormatMagnitude(set.magnitude) + " " + UnitSuffix(set.unit);
        },
        [](const NudgeCommand& nudge) -> std::string {
            return std::string("nudge ") + (nudge.delta >= 0 ? "+" : "") +
                   utils::FormatMagnitude(nudge.delta);
        },
        [](const CycleUnitCommand&) -> std::string { return "cycle unit"; },
        [](const ToggleLimitCommand&) -> std::string { return "toggle limit"; },
        [](const QuitCommand&) -> std::string { return "quit"; },
    }, command);
}
