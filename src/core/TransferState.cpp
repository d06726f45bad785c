#include "core/TransferState.hpp"

std::string ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kReadError:
            return "read error";
        case ErrorKind::kWriteError:
            return "write error";
        case ErrorKind::kTerminalError:
            return "terminal error";
        case ErrorKind::kInvalidRateInput:
        default:
            return "invalid rate input";
    }
}

TransferError::TransferError(ErrorKind kind, const std::string& message) :
    std::runtime_error(message),
    kind_(kind)
{}

std::string TransferStateName(TransferState state) {
    switch (state) {
        case TransferState::kRunning:
            return "Running";
        case TransferState::kPaused:
            return "Paused";
        case TransferState::kDraining:
            return "Draining";
        case TransferState::kCompleted:
            return "Completed";
        case TransferState::kFailed:
            return "Failed";
        case TransferState::kCancelled:
        default:
            return "Cancelled";
    }
}

bool IsTerminal(TransferState state) {
    return state == TransferState::kCompleted ||
           state == TransferState::kFailed ||
           state == TransferState::kCancelled;
}

TransferStateMachine::TransferStateMachine(TransferState initial) :
    state_(initial)
{
    if (initial != TransferState::kRunning && initial != TransferState::kPaused) {
        throw std::logic_error("transfer must start Running or Paused");
    }
}

void TransferStateMachine::TransitionTo(TransferState next) {
    bool allowed = false;
    switch (state_) {
        case TransferState::kRunning:
        case TransferState::kPaused:
            allowed = next != state_ && next != TransferState::kCompleted;
            break;
        case TransferState::kDraining:
            allowed = next == TransferState::kCompleted || next == TransferState::kFailed;
            break;
        default:
            allowed = false;
    }

    if (!allowed) {
        throw std::logic_error("illegal transfer transition " + TransferStateName(state_) +
                               " -> " + TransferStateName(next));
    }
    state_ = next;
}

void TransferStateMachine::Pause() {
    if (state_ == TransferState::kPaused) {
        return;
    }
    TransitionTo(TransferState::kPaused);
}

void TransferStateMachine::Resume() {
    if (state_ == TransferState::kRunning) {
        return;
    }
    TransitionTo(TransferState::kRunning);
}

void TransferStateMachine::BeginDrain() {
    TransitionTo(TransferState::kDraining);
}

void TransferStateMachine::Complete() {
    TransitionTo(TransferState::kCompleted);
}

void TransferStateMachine::Fail(ErrorKind kind) {
    TransitionTo(TransferState::kFailed);
    error_ = kind;
}

void TransferStateMachine::Cancel() {
    TransitionTo(TransferState::kCancelled);
}

int ExitOutcome::ExitCode() const {
    switch (state) {
        case TransferState::kCompleted:
            return kExitCompleted;
        case TransferState::kCancelled:
            return kExitCancelled;
        default:
            return kExitFailed;
    }
}
