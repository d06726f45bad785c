#pragma once

#include <string>

// Points fds 0 and 1 at the controlling terminal for the lifetime of the
// guard, so the interactive screen talks to the operator while the copy
// engine keeps its own duplicates of the original stdin and stdout.
// Construction throws TransferError(kTerminalError) when there is no usable
// terminal; destruction always restores the original descriptors.
class TerminalGuard {
public:
    explicit TerminalGuard(const std::string& device = "/dev/tty");
    ~TerminalGuard();

    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;

private:
    void Restore();

    int tty_fd_ = -1;
    int saved_stdin_ = -1;
    int saved_stdout_ = -1;
};
