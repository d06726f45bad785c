#include "core/Session.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

#include "ui/ProgressView.hpp"
#include "ui/TerminalGuard.hpp"
#include "ui/ValveUi.hpp"

using namespace std::chrono_literals;

namespace {

constexpr auto kHeadlessPollInterval = 100ms;

// Joins the engine thread on every path out of Session::Run, asking the
// engine to stop first if it is still going.
class EngineThread {
public:
    EngineThread(CopyEngine& engine, CommandChannel& commands) :
        commands_(commands),
        future_(promise_.get_future())
    {
        thread_ = std::thread([this, &engine] {
            try {
                promise_.set_value(engine.Run());
            } catch (const std::exception&) {
                promise_.set_exception(std::current_exception());
            }
        });
    }

    ~EngineThread() {
        if (!thread_.joinable()) {
            return;
        }
        if (!Finished()) {
            commands_.Push(QuitCommand{});
        }
        thread_.join();
    }

    bool Finished() const {
        return future_.wait_for(0s) == std::future_status::ready;
    }

    bool WaitFor(std::chrono::milliseconds timeout) const {
        return future_.wait_for(timeout) == std::future_status::ready;
    }

    ExitOutcome Join() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return future_.get();
    }

private:
    CommandChannel& commands_;
    std::promise<ExitOutcome> promise_;
    std::future<ExitOutcome> future_;
    std::thread thread_;
};

} // namespace

Session::Session(const Config& config,
                 InputSource& source,
                 OutputSink& sink,
                 utils::ActivityLog& log,
                 utils::NowFunction now) :
    config_(config),
    source_(source),
    sink_(sink),
    log_(log),
    now_(now),
    tracker_(config.total_size_hint, kDefaultRateWindow, now)
{
    EngineStatus initial;
    initial.limit = config_.initial_limit;
    initial.state = config_.initial_limit.paused ? TransferState::kPaused : TransferState::kRunning;
    status_.Set(initial);
}

void Session::RequestQuit() {
    commands_.Push(QuitCommand{});
}

void Session::SetInterruptCheck(std::function<bool()> check) {
    interrupted_ = std::move(check);
}

void Session::WaitHeadless(const std::function<bool()>& engine_finished) {
    bool quit_sent = false;
    while (!engine_finished()) {
        if (!quit_sent && interrupted_ && interrupted_()) {
            log_.Warning("Interrupted");
            RequestQuit();
            quit_sent = true;
        }
    }
}

// Returns false when the screen could not be used; the caller then falls back
// to headless mode with the engine unaffected.
bool Session::RunInteractive() {
    std::unique_ptr<TerminalGuard> terminal;
    try {
        terminal = std::make_unique<TerminalGuard>(config_.terminal_device);
    } catch (const TransferError& e) {
        log_.MirrorTo(&std::cerr);
        log_.Warning(std::string(e.what()) + ", continuing without interactive screen");
        return false;
    }

    {
        ValveUi ui(commands_, tracker_, status_, log_);
        ui.Run();
    }
    terminal.reset();
    log_.MirrorTo(&std::cerr);

    if (!IsTerminal(status_.Get().state)) {
        RequestQuit();
    }
    return true;
}

ExitOutcome Session::Run() {
    if (!config_.interactive) {
        log_.MirrorTo(&std::cerr);
    }

    CopyEngine engine(source_, sink_, commands_, tracker_, status_, log_,
                      config_.initial_limit, now_);
    EngineThread engine_thread(engine, commands_);

    if (!config_.interactive || !RunInteractive()) {
        WaitHeadless([&engine_thread] {
            return engine_thread.WaitFor(kHeadlessPollInterval);
        });
    }

    ExitOutcome outcome;
    try {
        outcome = engine_thread.Join();
    } catch (const std::exception& e) {
        outcome.state = TransferState::kFailed;
        outcome.message = e.what();
        outcome.bytes_transferred = tracker_.BytesTransferred();
        log_.Error(std::string("Copy engine stopped: ") + e.what());
    }

    EngineStatus status = status_.Get();
    status.state = outcome.state;
    log_.System(SummaryLine(tracker_.Snapshot(), status));
    return outcome;
}
