#pragma once

#include <cstddef>

// Byte source for the copy engine. Read returns 0 only at end of input and
// throws TransferError(kReadError) on failure.
class InputSource {
public:
    virtual ~InputSource() = default;
    virtual size_t Read(char* buffer, size_t capacity) = 0;
};

// Byte sink for the copy engine. Write consumes the whole buffer or throws
// TransferError(kWriteError).
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void Write(const char* data, size_t length) = 0;
    virtual void Flush() = 0;
};
