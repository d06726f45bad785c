#include "ui/TerminalGuard.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

#include "core/TransferState.hpp"

namespace {

void CloseIfOpen(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

} // namespace

TerminalGuard::TerminalGuard(const std::string& device) {
    if (isatty(STDOUT_FILENO)) {
        throw TransferError(ErrorKind::kTerminalError,
                            "Standard output is a terminal, interactive screen disabled");
    }

    tty_fd_ = open(device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (tty_fd_ == -1) {
        throw TransferError(ErrorKind::kTerminalError,
                            "Failed to open " + device + ": " + std::string(strerror(errno)));
    }
    if (!isatty(tty_fd_)) {
        CloseIfOpen(tty_fd_);
        throw TransferError(ErrorKind::kTerminalError, device + " is not a terminal");
    }

    saved_stdin_ = fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, 3);
    saved_stdout_ = fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
    if (saved_stdin_ == -1 || saved_stdout_ == -1) {
        std::string reason = strerror(errno);
        CloseIfOpen(saved_stdin_);
        CloseIfOpen(saved_stdout_);
        CloseIfOpen(tty_fd_);
        throw TransferError(ErrorKind::kTerminalError, "Failed to save standard streams: " + reason);
    }

    std::cout.flush();
    if (dup2(tty_fd_, STDIN_FILENO) == -1 || dup2(tty_fd_, STDOUT_FILENO) == -1) {
        std::string reason = strerror(errno);
        Restore();
        throw TransferError(ErrorKind::kTerminalError, "Failed to attach terminal: " + reason);
    }
}

TerminalGuard::~TerminalGuard() {
    Restore();
}

void TerminalGuard::Restore() {
    std::cout.flush();
    if (saved_stdin_ != -1) {
        dup2(saved_stdin_, STDIN_FILENO);
    }
    if (saved_stdout_ != -1) {
        dup2(saved_stdout_, STDOUT_FILENO);
    }
    CloseIfOpen(saved_stdin_);
    CloseIfOpen(saved_stdout_);
    CloseIfOpen(tty_fd_);
}
