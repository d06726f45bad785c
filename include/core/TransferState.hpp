#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    kReadError,
    kWriteError,
    kTerminalError,
    kInvalidRateInput
};

std::string ErrorKindName(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message);

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

enum class TransferState {
    kRunning,
    kPaused,
    kDraining,
    kCompleted,
    kFailed,
    kCancelled
};

std::string TransferStateName(TransferState state);
bool IsTerminal(TransferState state);

// Running <-> Paused, {Running, Paused} -> {Draining, Failed, Cancelled},
// Draining -> {Completed, Failed}. Anything else throws std::logic_error.
class TransferStateMachine {
public:
    explicit TransferStateMachine(TransferState initial = TransferState::kRunning);

    TransferState State() const { return state_; }
    std::optional<ErrorKind> Error() const { return error_; }
    bool IsFinished() const { return IsTerminal(state_); }

    void Pause();
    void Resume();
    void BeginDrain();
    void Complete();
    void Fail(ErrorKind kind);
    void Cancel();

private:
    void TransitionTo(TransferState next);

    TransferState state_;
    std::optional<ErrorKind> error_;
};

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

struct ExitOutcome {
    TransferState state = TransferState::kCompleted;
    std::optional<ErrorKind> error;
    std::string message;
    uint64_t bytes_transferred = 0;

    int ExitCode() const;
};
