#include "core/CommandChannel.hpp"

void CommandChannel::Push(Command command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(command));
    }
    pending_cv_.notify_all();
}

std::vector<Command> CommandChannel::DrainAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Command> drained(queue_.begin(), queue_.end());
    queue_.clear();
    return drained;
}

bool CommandChannel::WaitFor(std::optional<std::chrono::nanoseconds> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto has_pending = [this] { return !queue_.empty(); };

    if (!timeout) {
        pending_cv_.wait(lock, has_pending);
        return true;
    }
    return pending_cv_.wait_for(lock, *timeout, has_pending);
}

bool CommandChannel::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}
