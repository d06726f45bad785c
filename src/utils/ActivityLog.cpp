#include "utils/ActivityLog.hpp"

#include <algorithm>

namespace utils {

ActivityLog::ActivityLog(size_t max_messages) :
    max_messages_(std::max<size_t>(max_messages, 1))
{}

std::string ActivityLog::Tag(LogLevel level) {
    switch (level) {
        case LogLevel::kWarning:
            return "[WARNING]";
        case LogLevel::kError:
            return "[ERROR]";
        case LogLevel::kSystem:
            return "[SYSTEM]";
        case LogLevel::kInfo:
        default:
            return "[INFO]";
    }
}

void ActivityLog::Log(LogLevel level, const std::string& message) {
    std::string line = Tag(level) + " " + message;

    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(line);
    while (messages_.size() > max_messages_) {
        messages_.pop_front();
    }
    if (mirror_ != nullptr) {
        *mirror_ << "pipevalve: " << line << std::endl;
    }
}

std::vector<std::string> ActivityLog::GetMessages(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t take = std::min(count, messages_.size());
    return std::vector<std::string>(messages_.end() - static_cast<std::ptrdiff_t>(take),
                                    messages_.end());
}

size_t ActivityLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

void ActivityLog::MirrorTo(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    mirror_ = stream;
}

} // namespace utils
