#include "io/FdStream.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "core/TransferState.hpp"

namespace {

int DuplicateDescriptor(int fd, ErrorKind kind) {
    int duplicate = fcntl(fd, F_DUPFD_CLOEXEC, 3);
    if (duplicate == -1) {
        throw TransferError(kind, "Failed to duplicate descriptor " + std::to_string(fd) +
                                  ": " + std::string(strerror(errno)));
    }
    return duplicate;
}

} // namespace

FdInputSource::FdInputSource(int fd) :
    fd_(fd)
{}

FdInputSource::~FdInputSource() {
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
}

int FdInputSource::DuplicateStandardInput() {
    return DuplicateDescriptor(STDIN_FILENO, ErrorKind::kReadError);
}

size_t FdInputSource::Read(char* buffer, size_t capacity) {
    while (true) {
        ssize_t received = read(fd_, buffer, capacity);
        if (received >= 0) {
            return static_cast<size_t>(received);
        }
        if (errno == EINTR) {
            continue;
        }
        throw TransferError(ErrorKind::kReadError,
                            "Read error: " + std::string(strerror(errno)));
    }
}

std::optional<uint64_t> FdInputSource::RegularFileSize() const {
    struct stat info;
    if (fstat(fd_, &info) != 0 || !S_ISREG(info.st_mode)) {
        return std::nullopt;
    }
    off_t position = lseek(fd_, 0, SEEK_CUR);
    if (position < 0 || position > info.st_size) {
        return static_cast<uint64_t>(info.st_size);
    }
    return static_cast<uint64_t>(info.st_size - position);
}

FdOutputSink::FdOutputSink(int fd) :
    fd_(fd)
{}

FdOutputSink::~FdOutputSink() {
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
}

int FdOutputSink::DuplicateStandardOutput() {
    return DuplicateDescriptor(STDOUT_FILENO, ErrorKind::kWriteError);
}

void FdOutputSink::Write(const char* data, size_t length) {
    size_t written = 0;
    while (written < length) {
        ssize_t sent = write(fd_, data + written, length - written);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError(ErrorKind::kWriteError,
                                "Write error: " + std::string(strerror(errno)));
        }
        written += static_cast<size_t>(sent);
    }
}

void FdOutputSink::Flush() {
    if (fcntl(fd_, F_GETFD) == -1) {
        throw TransferError(ErrorKind::kWriteError,
                            "Flush error: " + std::string(strerror(errno)));
    }
}
