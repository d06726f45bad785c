#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "core/Command.hpp"

// Unbounded FIFO of operator commands. Any thread may push; the copy engine
// drains once per chunk and sleeps on it while waiting for admission.
class CommandChannel {
public:
    CommandChannel() = default;
    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    void Push(Command command);
    std::vector<Command> DrainAll();

    // Blocks until a command is pending or the timeout elapses. No timeout
    // waits until the next Push. Returns true if a command is pending.
    bool WaitFor(std::optional<std::chrono::nanoseconds> timeout);

    bool Empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable pending_cv_;
    std::deque<Command> queue_;
};
