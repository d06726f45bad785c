#pragma once

#include <functional>

#include "core/CommandChannel.hpp"
#include "core/Config.hpp"
#include "core/CopyEngine.hpp"
#include "core/ProgressTracker.hpp"
#include "core/TransferState.hpp"
#include "io/ByteStream.hpp"
#include "utils/ActivityLog.hpp"
#include "utils/SharedSlot.hpp"

// One transfer from start to ExitOutcome. Runs the copy engine on its own
// thread and either the interactive screen or a headless wait loop on the
// calling thread.
class Session {
public:
    Session(const Config& config,
            InputSource& source,
            OutputSink& sink,
            utils::ActivityLog& log,
            utils::NowFunction now = utils::SteadyNow);

    ExitOutcome Run();

    // Safe from any thread.
    void RequestQuit();
    // Polled by the headless loop; true turns into a Quit command.
    void SetInterruptCheck(std::function<bool()> check);

    CommandChannel& Commands() { return commands_; }
    const ProgressTracker& Tracker() const { return tracker_; }
    EngineStatus Status() const { return status_.Get(); }

private:
    bool RunInteractive();
    void WaitHeadless(const std::function<bool()>& engine_finished);

    Config config_;
    InputSource& source_;
    OutputSink& sink_;
    utils::ActivityLog& log_;
    utils::NowFunction now_;

    CommandChannel commands_;
    ProgressTracker tracker_;
    utils::SharedSlot<EngineStatus> status_;
    std::function<bool()> interrupted_;
};
