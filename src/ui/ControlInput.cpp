#include "ui/ControlInput.hpp"

#include <cctype>

#include "core/TransferState.hpp"

std::optional<Command> ControlInput::Handle(const KeyPress& key, const RateLimit& current) {
    if (key.code == KeyCode::kInterrupt) {
        editing_ = false;
        edit_buffer_.clear();
        return QuitCommand{};
    }
    if (editing_) {
        return HandleEditing(key, current);
    }

    bool adjusts_limit = key.code == KeyCode::kArrowUp || key.code == KeyCode::kArrowDown ||
                         key.code == KeyCode::kArrowLeft || key.code == KeyCode::kArrowRight;
    if (key.code == KeyCode::kCharacter) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(key.character)));
        adjusts_limit = c == '+' || c == '=' || c == '-' || c == '_' || c == 'u';
        if (c == 'l' && current.unlimited && current.magnitude <= 0.0) {
            editing_ = true;
            edit_buffer_.clear();
            notice_ = "no previous limit, type a rate";
            return std::nullopt;
        }
    }
    if (adjusts_limit && current.unlimited) {
        notice_ = "rate is unlimited, press L or R to set a limit";
        return std::nullopt;
    }

    std::optional<Command> command;
    switch (key.code) {
        case KeyCode::kArrowUp:
            command = NudgeCommand{kSmallNudge};
            break;
        case KeyCode::kArrowDown:
            command = NudgeCommand{-kSmallNudge};
            break;
        case KeyCode::kArrowRight:
            command = NudgeCommand{kLargeNudge};
            break;
        case KeyCode::kArrowLeft:
            command = NudgeCommand{-kLargeNudge};
            break;
        case KeyCode::kEscape:
            command = QuitCommand{};
            break;
        case KeyCode::kCharacter:
            switch (std::tolower(static_cast<unsigned char>(key.character))) {
                case 'p':
                case ' ':
                    if (current.paused) {
                        command = ResumeCommand{};
                    } else {
                        command = PauseCommand{};
                    }
                    break;
                case '+':
                case '=':
                    command = NudgeCommand{kSmallNudge};
                    break;
                case '-':
                case '_':
                    command = NudgeCommand{-kSmallNudge};
                    break;
                case 'u':
                    command = CycleUnitCommand{};
                    break;
                case 'l':
                    command = ToggleLimitCommand{};
                    break;
                case 'r':
                    editing_ = true;
                    edit_buffer_.clear();
                    notice_.clear();
                    break;
                case 'q':
                    command = QuitCommand{};
                    break;
                default:
                    break;
            }
            break;
        default:
            break;
    }

    if (command) {
        notice_.clear();
    }
    return command;
}

std::optional<Command> ControlInput::HandleEditing(const KeyPress& key, const RateLimit& current) {
    switch (key.code) {
        case KeyCode::kEscape:
            editing_ = false;
            edit_buffer_.clear();
            return std::nullopt;
        case KeyCode::kBackspace:
            if (!edit_buffer_.empty()) {
                edit_buffer_.pop_back();
            }
            return std::nullopt;
        case KeyCode::kReturn: {
            editing_ = false;
            std::string entered = edit_buffer_;
            edit_buffer_.clear();
            try {
                RateLimit parsed = ParseRateLimit(entered, current.unit);
                notice_.clear();
                return SetRateCommand{parsed.magnitude, parsed.unit};
            } catch (const TransferError& e) {
                notice_ = e.what();
                return std::nullopt;
            }
        }
        case KeyCode::kCharacter:
            if (std::isprint(static_cast<unsigned char>(key.character)) &&
                edit_buffer_.size() < kMaxRateEntryLength) {
                edit_buffer_.push_back(key.character);
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}
