#pragma once

#include "graph/intent.hpp"
#include "netting/netting_config.hpp"
#include "util/logging.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace netclear {

/// Parsed command line of netclear_cli.
struct CliOptions {
    NettingConfig config;
    std::string input_path;             // Empty: use the demo set
    LogLevel log_level = LogLevel::Warn;
    bool show_help = false;
};

/// Bad flag, missing value or surplus argument. Exit code 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Parse arguments (program name excluded). Throws UsageError.
CliOptions parseCliArgs(const std::vector<std::string>& args);

void printUsage(std::ostream& os);

/// The built-in demo obligations.
std::vector<Intent> demoIntents();

/// Parse, net and print. Returns the process exit code:
/// 0 success, 1 runtime failure, 2 usage or configuration error.
int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace netclear
