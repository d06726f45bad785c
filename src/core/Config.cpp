#include "core/Config.hpp"

#include <stdexcept>

#include "core/TransferState.hpp"

namespace {

const std::string& RequireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Option " + args[i] + " requires a value");
    }
    return args[++i];
}

} // namespace

void PrintUsage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [options] < input > output" << std::endl;
    out << "Copies standard input to standard output under a live-adjustable rate limit." << std::endl;
    out << "Options:" << std::endl;
    out << "  -L, --rate-limit <rate>   Initial limit, e.g. 512K, 1.5MiB/s, 100 (bytes/s)" << std::endl;
    out << "  -s, --size <size>         Expected input size, e.g. 10M (used for progress and ETA)" << std::endl;
    out << "  -p, --paused              Start with the transfer paused" << std::endl;
    out << "  -n, --no-ui               Never open the interactive screen" << std::endl;
    out << "  -h, --help                Show this help message" << std::endl;
    out << "Keys: P/space pause, +/- or Up/Down adjust by 1, Left/Right by 10," << std::endl;
    out << "      U cycle unit, L toggle limit, R type a rate, Q quit" << std::endl;
}

Config ParseCommandLine(const std::vector<std::string>& args) {
    Config config;
    bool start_paused = false;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-L" || arg == "--rate-limit") {
            const std::string& value = RequireValue(args, i);
            try {
                config.initial_limit = ParseRateLimit(value);
            } catch (const TransferError& e) {
                throw std::invalid_argument(e.what());
            }
        }
        else if (arg == "-s" || arg == "--size") {
            config.total_size_hint = ParseByteSize(RequireValue(args, i));
        }
        else if (arg == "-p" || arg == "--paused") {
            start_paused = true;
        }
        else if (arg == "-n" || arg == "--no-ui") {
            config.interactive = false;
        }
        else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        }
        else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    config.initial_limit.paused = start_paused;
    return config;
}

Config ParseCommandLine(int argc, char* argv[]) {
    return ParseCommandLine(std::vector<std::string>(argv, argv + argc));
}
