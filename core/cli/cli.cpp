#include "cli/cli.hpp"

#include "graph/intent_io.hpp"
#include "netting/netting_engine.hpp"

#include <fstream>

namespace netclear {

namespace {

size_t parseCount(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(value, &pos, 10);
        if (pos != value.size() || value[0] == '-') throw std::invalid_argument(value);
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

double parseSeconds(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw UsageError(flag + " expects a number of seconds, got '" + value + "'");
    }
}

std::vector<Intent> loadIntents(const std::string& path) {
    if (path.empty()) return demoIntents();
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    return parseIntents(in);
}

void printIntents(std::ostream& out, const std::vector<Intent>& intents) {
    for (const Intent& intent : intents) {
        out << formatIntent(intent) << "\n";
    }
}

} // namespace

void printUsage(std::ostream& os) {
    os << "usage: netclear_cli [options] [FILE]\n"
          "  Reads 'SENDER RECEIVER TOKEN AMOUNT' lines from FILE (demo set if omitted).\n"
          "  --max-cycle-length N   edges per cycle (default 4)\n"
          "  --max-cycles N         cycles recorded per run (default 100000)\n"
          "  --max-expansions N     search steps per run (default 10000000)\n"
          "  --deadline SECONDS     enumeration time limit (default none)\n"
          "  --keep-rotations       net every rotation of a cycle separately\n"
          "  --verify               check net positions are conserved\n"
          "  --log-level LEVEL      debug|info|warn|error|off\n"
          "  --verbose              same as --log-level info\n"
          "  --debug                same as --log-level debug\n"
          "  -h, --help             show this help\n";
}

CliOptions parseCliArgs(const std::vector<std::string>& args) {
    CliOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw UsageError(arg + " requires a value");
            return args[++i];
        };

        if (arg == "--max-cycle-length") {
            opts.config.max_cycle_length = parseCount(arg, value());
        } else if (arg == "--max-cycles") {
            opts.config.max_cycles = parseCount(arg, value());
        } else if (arg == "--max-expansions") {
            opts.config.max_expansions = parseCount(arg, value());
        } else if (arg == "--deadline") {
            opts.config.budget_seconds = parseSeconds(arg, value());
        } else if (arg == "--keep-rotations") {
            opts.config.dedupe_rotations = false;
        } else if (arg == "--verify") {
            opts.config.verify_conservation = true;
        } else if (arg == "--log-level") {
            try {
                opts.log_level = parseLogLevel(value());
            } catch (const std::invalid_argument& e) {
                throw UsageError(e.what());
            }
        } else if (arg == "--verbose") {
            opts.log_level = LogLevel::Info;
        } else if (arg == "--debug") {
            opts.log_level = LogLevel::Debug;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else if (opts.input_path.empty()) {
            opts.input_path = arg;
        } else {
            throw UsageError("only one input file may be given");
        }
    }
    return opts;
}

std::vector<Intent> demoIntents() {
    return {
        {"A", "B", "ETH", 100},
        {"B", "C", "ETH", 50},
        {"C", "A", "ETH", 30},
        {"D", "E", "USDC", 200},
        {"E", "D", "USDC", 200},
    };
}

int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    CliOptions opts;
    try {
        opts = parseCliArgs(args);
        if (opts.show_help) {
            printUsage(out);
            return 0;
        }
        opts.config.validate();
    } catch (const UsageError& e) {
        err << "netclear_cli: " << e.what() << "\n";
        printUsage(err);
        return 2;
    } catch (const std::invalid_argument& e) {
        err << "netclear_cli: " << e.what() << "\n";
        return 2;
    }
    setLogLevel(opts.log_level);

    try {
        std::vector<Intent> intents = loadIntents(opts.input_path);

        out << "Original intents:\n";
        printIntents(out, intents);

        NettingEngine engine(opts.config);
        NettingReport report = engine.run(intents);

        out << "\nRemaining intents after netting:\n";
        printIntents(out, report.intents);

        out << "\n" << report.cycles_found << " cycles in " << report.sccs_found
            << " components, " << report.nettings_applied << " nettings applied, gross "
            << report.gross_before << " -> " << report.gross_after << "\n";
        for (const auto& [token, netted] : report.netted_by_token) {
            out << "  " << token << ": " << netted << " canceled\n";
        }
    } catch (const std::exception& e) {
        err << "netclear_cli: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace netclear
