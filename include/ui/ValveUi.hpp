#pragma once

#include <atomic>
#include <chrono>
#include <thread>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>

#include "core/CommandChannel.hpp"
#include "core/CopyEngine.hpp"
#include "core/ProgressTracker.hpp"
#include "ui/ControlInput.hpp"
#include "utils/ActivityLog.hpp"
#include "utils/SharedSlot.hpp"

// Full-screen control surface. Reads published snapshots, pushes commands,
// and returns from Run once the transfer reaches a terminal state or the
// screen is closed.
class ValveUi {
public:
    ValveUi(CommandChannel& commands,
            const ProgressTracker& tracker,
            const utils::SharedSlot<EngineStatus>& status,
            const utils::ActivityLog& log);
    ~ValveUi();

    void Run();

private:
    ftxui::Component BuildUi();
    ftxui::Element Render();
    bool OnEvent(const ftxui::Event& event);
    void StopUpdates();

    CommandChannel& commands_;
    const ProgressTracker& tracker_;
    const utils::SharedSlot<EngineStatus>& status_;
    const utils::ActivityLog& log_;

    ControlInput input_;
    bool quit_sent_ = false;
    std::atomic<bool> running_{true};
    std::thread update_thread_;

    ftxui::Component main_component_;
};
