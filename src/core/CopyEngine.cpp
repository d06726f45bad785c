#include "core/CopyEngine.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "utils/Format.hpp"

CopyEngine::CopyEngine(InputSource& source,
                       OutputSink& sink,
                       CommandChannel& commands,
                       ProgressTracker& tracker,
                       utils::SharedSlot<EngineStatus>& status,
                       utils::ActivityLog& log,
                       const RateLimit& initial_limit,
                       utils::NowFunction now) :
    source_(source),
    sink_(sink),
    commands_(commands),
    tracker_(tracker),
    status_(status),
    log_(log),
    rate_(initial_limit, std::move(now)),
    state_(initial_limit.paused ? TransferState::kPaused : TransferState::kRunning)
{}

void CopyEngine::Publish(const std::string& error_message) {
    EngineStatus status;
    status.limit = rate_.Limit();
    status.state = state_.State();
    status.error = state_.Error();
    status.error_message = error_message;
    status_.Set(status);
}

bool CopyEngine::ApplyPendingCommands() {
    auto commands = commands_.DrainAll();
    if (!commands.empty()) {
        for (const auto& command : commands) {
            Apply(command);
        }
        Publish();
    }
    return !quit_requested_;
}

void CopyEngine::Apply(const Command& command) {
    std::visit(Overloaded{
        [this](const PauseCommand&) {
            if (rate_.Limit().paused) {
                return;
            }
            rate_.Pause();
            state_.Pause();
            log_.Info("Transfer paused");
        },
        [this](const ResumeCommand&) {
            if (!rate_.Limit().paused) {
                return;
            }
            rate_.Resume();
            state_.Resume();
            log_.Info("Transfer resumed");
        },
        [this](const SetRateCommand& set) {
            rate_.Configure(set.magnitude, set.unit);
            log_.Info("Rate limit set to " + rate_.Limit().Describe());
        },
        [this](const NudgeCommand& nudge) {
            const RateLimit& current = rate_.Limit();
            rate_.Configure(std::max(0.0, current.magnitude + nudge.delta), current.unit);
            log_.Info("Rate limit set to " + rate_.Limit().Describe());
        },
        [this](const CycleUnitCommand&) {
            const RateLimit& current = rate_.Limit();
            rate_.Configure(current.magnitude, NextUnit(current.unit));
            log_.Info("Rate limit set to " + rate_.Limit().Describe());
        },
        [this](const ToggleLimitCommand&) {
            rate_.SetUnlimited(!rate_.Limit().unlimited);
            log_.Info("Rate limit set to " + rate_.Limit().Describe());
        },
        [this](const QuitCommand&) {
            if (!quit_requested_) {
                log_.Warning("Quit requested");
            }
            quit_requested_ = true;
        },
    }, command);
}

bool CopyEngine::SuspendForAdmission(std::optional<std::chrono::nanoseconds> timeout) {
    commands_.WaitFor(timeout);
    return ApplyPendingCommands();
}

ExitOutcome CopyEngine::Run() {
    std::vector<char> buffer(kMaxChunkSize);
    auto suspend = [this](std::optional<std::chrono::nanoseconds> timeout) {
        return SuspendForAdmission(timeout);
    };

    log_.System("Transfer started, limit " + rate_.Limit().Describe());
    Publish();

    while (true) {
        if (!ApplyPendingCommands()) {
            return Cancel();
        }

        size_t length = 0;
        try {
            length = source_.Read(buffer.data(), rate_.PreferredChunkSize());
        } catch (const TransferError& e) {
            return Fail(e);
        }

        if (length == 0) {
            return Drain();
        }

        if (!rate_.Acquire(length, suspend)) {
            return Cancel();
        }

        try {
            sink_.Write(buffer.data(), length);
        } catch (const TransferError& e) {
            return Fail(e);
        }

        tracker_.Update(length);
    }
}

ExitOutcome CopyEngine::Drain() {
    state_.BeginDrain();
    Publish();
    try {
        sink_.Flush();
    } catch (const TransferError& e) {
        return Fail(e);
    }
    state_.Complete();
    Publish();
    log_.System("Input exhausted, transfer completed");
    return Outcome("completed");
}

ExitOutcome CopyEngine::Fail(const TransferError& error) {
    state_.Fail(error.Kind());
    Publish(error.what());
    log_.Error(error.what());
    return Outcome(error.what());
}

ExitOutcome CopyEngine::Cancel() {
    state_.Cancel();
    Publish();
    log_.Warning("Transfer cancelled after " + utils::FormatBytes(tracker_.BytesTransferred()));
    return Outcome("cancelled");
}

ExitOutcome CopyEngine::Outcome(const std::string& message) const {
    ExitOutcome outcome;
    outcome.state = state_.State();
    outcome.error = state_.Error();
    outcome.message = message;
    outcome.bytes_transferred = tracker_.BytesTransferred();
    return outcome;
}
