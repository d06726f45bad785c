#pragma once

#include <mutex>
#include <utility>

namespace utils {

// Single value published by one thread and copied out by others.
template <typename T>
class SharedSlot {
public:
    explicit SharedSlot(T value = T()) : value_(std::move(value)) {}

    void Set(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
    }

    T Get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

private:
    mutable std::mutex mutex_;
    T value_;
};

} // namespace utils
