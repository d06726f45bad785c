#pragma once

#include <cstdint>
#include <optional>

#include "io/ByteStream.hpp"

// Reads from a file descriptor it owns.
class FdInputSource : public InputSource {
public:
    explicit FdInputSource(int fd);
    ~FdInputSource() override;

    FdInputSource(const FdInputSource&) = delete;
    FdInputSource& operator=(const FdInputSource&) = delete;

    size_t Read(char* buffer, size_t capacity) override;

    // Size of the underlying file when it is a regular file.
    std::optional<uint64_t> RegularFileSize() const;

    // Private duplicate of fd 0, unaffected by later redirection of stdin.
    static int DuplicateStandardInput();

private:
    int fd_;
};

// Unbuffered writer to a file descriptor it owns.
class FdOutputSink : public OutputSink {
public:
    explicit FdOutputSink(int fd);
    ~FdOutputSink() override;

    FdOutputSink(const FdOutputSink&) = delete;
    FdOutputSink& operator=(const FdOutputSink&) = delete;

    void Write(const char* data, size_t length) override;
    // Writes go straight to the descriptor, so this only validates it.
    void Flush() override;

    static int DuplicateStandardOutput();

private:
    int fd_;
};
