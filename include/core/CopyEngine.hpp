#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/CommandChannel.hpp"
#include "core/ProgressTracker.hpp"
#include "core/RateController.hpp"
#include "core/TransferState.hpp"
#include "io/ByteStream.hpp"
#include "utils/ActivityLog.hpp"
#include "utils/SharedSlot.hpp"

// What the engine publishes for readers on other threads.
struct EngineStatus {
    RateLimit limit;
    TransferState state = TransferState::kRunning;
    std::optional<ErrorKind> error;
    std::string error_message;
};

// Drives read -> admit -> write until the input ends, an I/O error occurs or
// a Quit is applied. The only writer of the token bucket and of the tracker.
class CopyEngine {
public:
    CopyEngine(InputSource& source,
               OutputSink& sink,
               CommandChannel& commands,
               ProgressTracker& tracker,
               utils::SharedSlot<EngineStatus>& status,
               utils::ActivityLog& log,
               const RateLimit& initial_limit,
               utils::NowFunction now = utils::SteadyNow);

    ExitOutcome Run();

    const RateController& Rate() const { return rate_; }
    TransferState State() const { return state_.State(); }

private:
    // Applies everything queued, in order. False once a Quit has been seen.
    bool ApplyPendingCommands();
    void Apply(const Command& command);
    bool SuspendForAdmission(std::optional<std::chrono::nanoseconds> timeout);
    void Publish(const std::string& error_message = std::string());

    ExitOutcome Drain();
    ExitOutcome Fail(const TransferError& error);
    ExitOutcome Cancel();
    ExitOutcome Outcome(const std::string& message) const;

    InputSource& source_;
    OutputSink& sink_;
    CommandChannel& commands_;
    ProgressTracker& tracker_;
    utils::SharedSlot<EngineStatus>& status_;
    utils::ActivityLog& log_;

    RateController rate_;
    TransferStateMachine state_;
    bool quit_requested_ = false;
};
