#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace utils {

enum class LogLevel {
    kInfo,
    kWarning,
    kError,
    kSystem
};

// Bounded list of tagged log lines shared by the engine and the UI.
// Optionally mirrored to a stream when nothing renders the panel.
class ActivityLog {
public:
    explicit ActivityLog(size_t max_messages = 200);

    void Log(LogLevel level, const std::string& message);
    void Info(const std::string& message) { Log(LogLevel::kInfo, message); }
    void Warning(const std::string& message) { Log(LogLevel::kWarning, message); }
    void Error(const std::string& message) { Log(LogLevel::kError, message); }
    void System(const std::string& message) { Log(LogLevel::kSystem, message); }

    std::vector<std::string> GetMessages(size_t count) const;
    size_t Size() const;

    void MirrorTo(std::ostream* stream);

    static std::string Tag(LogLevel level);

private:
    mutable std::mutex mutex_;
    std::deque<std::string> messages_;
    size_t max_messages_;
    std::ostream* mirror_ = nullptr;
};

} // namespace utils
