#pragma once

#include <optional>
#include <string>

#include "core/Command.hpp"
#include "core/RateLimit.hpp"

enum class KeyCode {
    kCharacter,
    kReturn,
    kEscape,
    kBackspace,
    kArrowUp,
    kArrowDown,
    kArrowLeft,
    kArrowRight,
    kInterrupt,
    kOther
};

struct KeyPress {
    KeyCode code = KeyCode::kOther;
    char character = '\0';

    static KeyPress Character(char c) { return KeyPress{KeyCode::kCharacter, c}; }
    static KeyPress Special(KeyCode code) { return KeyPress{code, '\0'}; }
};

constexpr double kSmallNudge = 1.0;
constexpr double kLargeNudge = 10.0;
constexpr size_t kMaxRateEntryLength = 32;

// Maps keystrokes to commands. Holds only presentation state (the rate being
// typed and the last inline notice); the limit it reacts to is the last one
// the engine published.
class ControlInput {
public:
    std::optional<Command> Handle(const KeyPress& key, const RateLimit& current);

    bool IsEditing() const { return editing_; }
    const std::string& EditBuffer() const { return edit_buffer_; }
    const std::string& Notice() const { return notice_; }

private:
    std::optional<Command> HandleEditing(const KeyPress& key, const RateLimit& current);

    bool editing_ = false;
    std::string edit_buffer_;
    std::string notice_;
};
