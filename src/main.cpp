#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "core/Config.hpp"
#include "core/Session.hpp"
#include "io/FdStream.hpp"
#include "utils/ActivityLog.hpp"

namespace {

volatile std::sig_atomic_t interrupted = 0;

void HandleInterrupt(int) {
    interrupted = 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    Config config;
    try {
        config = ParseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        PrintUsage(std::cerr, argv[0]);
        return kExitUsage;
    }

    if (config.show_help) {
        PrintUsage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        auto source = std::make_unique<FdInputSource>(FdInputSource::DuplicateStandardInput());
        auto sink = std::make_unique<FdOutputSink>(FdOutputSink::DuplicateStandardOutput());

        if (!config.total_size_hint) {
            config.total_size_hint = source->RegularFileSize();
        }

        std::signal(SIGINT, HandleInterrupt);

        utils::ActivityLog log;
        Session session(config, *source, *sink, log);
        session.SetInterruptCheck([] {
            return interrupted != 0;
        });

        ExitOutcome outcome = session.Run();
        return outcome.ExitCode();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailed;
    }
}
