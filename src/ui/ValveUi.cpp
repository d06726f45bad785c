#include "ui/ValveUi.hpp"

#include <string>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include "ui/ProgressView.hpp"
#include "utils/Format.hpp"

using namespace std::chrono_literals;

namespace {

constexpr auto kRenderTick = 100ms;
constexpr int kBarWidth = 50;

KeyPress TranslateEvent(const ftxui::Event& event) {
    using ftxui::Event;

    if (event.input() == "\x03") {
        return KeyPress::Special(KeyCode::kInterrupt);
    }
    if (event == Event::Return) {
        return KeyPress::Special(KeyCode::kReturn);
    }
    if (event == Event::Escape) {
        return KeyPress::Special(KeyCode::kEscape);
    }
    if (event == Event::Backspace) {
        return KeyPress::Special(KeyCode::kBackspace);
    }
    if (event == Event::ArrowUp) {
        return KeyPress::Special(KeyCode::kArrowUp);
    }
    if (event == Event::ArrowDown) {
        return KeyPress::Special(KeyCode::kArrowDown);
    }
    if (event == Event::ArrowLeft) {
        return KeyPress::Special(KeyCode::kArrowLeft);
    }
    if (event == Event::ArrowRight) {
        return KeyPress::Special(KeyCode::kArrowRight);
    }
    if (event.is_character() && event.character().size() == 1) {
        return KeyPress::Character(event.character()[0]);
    }
    return KeyPress::Special(KeyCode::kOther);
}

ftxui::Color StateColor(TransferState state) {
    switch (state) {
        case TransferState::kRunning:
            return ftxui::Color::GreenLight;
        case TransferState::kPaused:
            return ftxui::Color::YellowLight;
        case TransferState::kDraining:
        case TransferState::kCompleted:
            return ftxui::Color::CyanLight;
        case TransferState::kFailed:
            return ftxui::Color::RedLight;
        default:
            return ftxui::Color::GrayLight;
    }
}

ftxui::Element Row(const std::string& label, ftxui::Element value) {
    using namespace ftxui;
    return hbox({
        text(label) | bold | size(WIDTH, EQUAL, 16),
        std::move(value)
    });
}

} // namespace

ValveUi::ValveUi(CommandChannel& commands,
                 const ProgressTracker& tracker,
                 const utils::SharedSlot<EngineStatus>& status,
                 const utils::ActivityLog& log) :
    commands_(commands),
    tracker_(tracker),
    status_(status),
    log_(log)
{
    main_component_ = BuildUi();
}

ValveUi::~ValveUi() {
    StopUpdates();
}

bool ValveUi::OnEvent(const ftxui::Event& event) {
    if (event == ftxui::Event::Custom) {
        return false;
    }

    EngineStatus status = status_.Get();
    auto command = input_.Handle(TranslateEvent(event), status.limit);
    if (!command) {
        return true;
    }

    if (std::holds_alternative<QuitCommand>(*command)) {
        if (quit_sent_) {
            return true;
        }
        quit_sent_ = true;
    }
    commands_.Push(*command);
    return true;
}

ftxui::Component ValveUi::BuildUi() {
    using namespace ftxui;

    auto renderer = Renderer([this] {
        return Render();
    });

    return CatchEvent(renderer, [this](Event event) {
        return OnEvent(event);
    });
}

ftxui::Element ValveUi::Render() {
    using namespace ftxui;

    TransferSnapshot snapshot = tracker_.Snapshot();
    EngineStatus status = status_.Get();
    auto logs = log_.GetMessages(15);

    auto header = hbox({
        text(" PIPE VALVE ") | bold | inverted | center
    }) | center | border;

    Elements info;

    std::string state_text = TransferStateName(status.state);
    if (quit_sent_ && !IsTerminal(status.state)) {
        state_text += " (quitting)";
    }
    info.push_back(Row("Status:", hbox({
        text(state_text) | bold | color(StateColor(status.state)),
        filler(),
        status.limit.paused ? text(" [PAUSED] ") | bold | inverted | blink : text("")
    })));

    info.push_back(Row("Transferred:", text(TransferredText(snapshot))));
    info.push_back(Row("Target rate:", text(TargetRateText(status.limit))));

    auto current_rate = text(utils::FormatRate(snapshot.smoothed_rate));
    if (IsRateSaturated(snapshot.smoothed_rate, status.limit)) {
        current_rate = current_rate | bold;
    }
    info.push_back(Row("Current rate:", current_rate));

    info.push_back(Row("Elapsed:", text(utils::FormatDuration(
        std::chrono::duration_cast<std::chrono::seconds>(snapshot.elapsed)))));
    info.push_back(Row("ETA:", text(utils::FormatEta(snapshot.eta))));

    if (auto ratio = snapshot.Ratio()) {
        int percentage = static_cast<int>(*ratio * 100.0);
        info.push_back(text(""));
        info.push_back(hbox({
            text("["),
            text(ProgressBar(*ratio, kBarWidth)) | color(Color::GreenLight),
            text("] "),
            text(std::to_string(percentage) + "%") | bold
        }) | center);
    }

    if (input_.IsEditing()) {
        info.push_back(text(""));
        info.push_back(hbox({
            text(" enter a new rate: ") | bgcolor(Color::Blue) | color(Color::White),
            text(" "),
            text(input_.EditBuffer()) | bold,
            text("_") | blink
        }));
    }
    if (!input_.Notice().empty()) {
        info.push_back(text(input_.Notice()) | color(Color::RedLight));
    }

    auto info_panel = window(
        text(" TRANSFER ") | bold | center,
        vbox(info) | frame | size(HEIGHT, LESS_THAN, 20)
    );

    Elements log_entries;
    for (const auto& log : logs) {
        std::string log_text = log;
        if (log_text.length() > 90) {
            log_text = log_text.substr(0, 87) + "...";
        }

        auto log_element = text(" " + log_text);

        if (log.find("[ERROR]") != std::string::npos) {
            log_element = log_element | color(Color::RedLight);
        } else if (log.find("[WARNING]") != std::string::npos) {
            log_element = log_element | color(Color::YellowLight);
        } else if (log.find("[SYSTEM]") != std::string::npos) {
            log_element = log_element | color(Color::BlueLight);
        }

        log_entries.push_back(log_element);
    }

    auto log_panel = window(
        text(" ACTIVITY LOG ") | bold | center,
        vbox(log_entries) | frame | flex
    );

    std::string controls = input_.IsEditing()
        ? "Enter=Apply  Esc=Cancel  Backspace=Delete"
        : "P=Pause/Resume  +/-=Adjust  Left/Right=Adjust x10  U=Unit  L=Limit  R=Rate  Q=Quit";

    return vbox({
        header,
        info_panel,
        log_panel | flex,
        separator(),
        text(controls) | center | dim
    });
}

void ValveUi::Run() {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    // Ctrl+C cancels the transfer like Q instead of aborting the process.
    screen.ForceHandleCtrlC(false);

    update_thread_ = std::thread([this, &screen]() {
        while (running_) {
            std::this_thread::sleep_for(kRenderTick);
            if (IsTerminal(status_.Get().state)) {
                screen.Exit();
                break;
            }
            screen.PostEvent(Event::Custom);
        }
    });

    // The refresh thread holds a reference to screen; stop it before screen
    // goes out of scope, including when Loop throws.
    struct UpdateThreadStopper {
        ValveUi& ui;
        ~UpdateThreadStopper() { ui.StopUpdates(); }
    } stopper{*this};

    screen.Loop(main_component_);
}

void ValveUi::StopUpdates() {
    running_ = false;
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
}
