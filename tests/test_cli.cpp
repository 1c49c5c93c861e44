#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include "util/logging.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace netclear;

namespace {

std::string dataFile(const std::string& name) {
    return std::string(NETCLEAR_TEST_DATA_DIR) + "/" + name;
}

class CliTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = logLevel(); }
    void TearDown() override { setLogLevel(saved_); }

    int run(const std::vector<std::string>& args) {
        out_.str("");
        err_.str("");
        return runCli(args, out_, err_);
    }

    std::ostringstream out_;
    std::ostringstream err_;
    LogLevel saved_ = LogLevel::Warn;
};

const char* kDemoResidual =
    "Remaining intents after netting:\n"
    "A -> B: 70 ETH\n"
    "B -> C: 20 ETH\n";

} // namespace

// ─── Argument parsing ──────────────────────────────────────────

TEST_F(CliTest, ParsesAllFlags) {
    CliOptions opts = parseCliArgs({"--max-cycle-length", "6", "--max-cycles", "50",
                                    "--max-expansions", "900", "--deadline", "1.5",
                                    "--keep-rotations", "--verify", "in.txt"});
    EXPECT_EQ(opts.config.max_cycle_length, 6u);
    EXPECT_EQ(opts.config.max_cycles, 50u);
    EXPECT_EQ(opts.config.max_expansions, 900u);
    EXPECT_DOUBLE_EQ(opts.config.budget_seconds, 1.5);
    EXPECT_FALSE(opts.config.dedupe_rotations);
    EXPECT_TRUE(opts.config.verify_conservation);
    EXPECT_EQ(opts.input_path, "in.txt");
    EXPECT_FALSE(opts.show_help);
}

TEST_F(CliTest, LogLevelFlags) {
    EXPECT_EQ(parseCliArgs({}).log_level, LogLevel::Warn);
    EXPECT_EQ(parseCliArgs({"--verbose"}).log_level, LogLevel::Info);
    EXPECT_EQ(parseCliArgs({"--debug"}).log_level, LogLevel::Debug);
    EXPECT_EQ(parseCliArgs({"--log-level", "error"}).log_level, LogLevel::Error);
}

TEST_F(CliTest, UsageErrors) {
    EXPECT_THROW(parseCliArgs({"--bogus"}), UsageError);
    EXPECT_THROW(parseCliArgs({"--max-cycles"}), UsageError);
    EXPECT_THROW(parseCliArgs({"--max-cycles", "-3"}), UsageError);
    EXPECT_THROW(parseCliArgs({"--deadline", "soon"}), UsageError);
    EXPECT_THROW(parseCliArgs({"--log-level", "loud"}), UsageError);
    EXPECT_THROW(parseCliArgs({"a.txt", "b.txt"}), UsageError);
}

// ─── Exit codes and output ─────────────────────────────────────

TEST_F(CliTest, DemoSetNets) {
    EXPECT_EQ(run({}), 0);
    EXPECT_NE(out_.str().find("Original intents:\nA -> B: 100 ETH\n"), std::string::npos);
    EXPECT_NE(out_.str().find(kDemoResidual), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliTest, FileInputMatchesDemo) {
    EXPECT_EQ(run({"--verify", dataFile("demo_intents.txt")}), 0);
    EXPECT_NE(out_.str().find(kDemoResidual), std::string::npos);
    EXPECT_NE(out_.str().find("ETH: 90 canceled"), std::string::npos);
}

TEST_F(CliTest, DebugFlagAccepted) {
    EXPECT_EQ(run({"--debug", "--log-level", "off"}), 0);
    EXPECT_NE(out_.str().find(kDemoResidual), std::string::npos);
}

TEST_F(CliTest, HelpExitsZero) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out_.str().find("usage: netclear_cli"), std::string::npos);
}

TEST_F(CliTest, UsageErrorExitsTwo) {
    EXPECT_EQ(run({"--bogus"}), 2);
    EXPECT_NE(err_.str().find("unknown option --bogus"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, InvalidConfigExitsTwo) {
    EXPECT_EQ(run({"--max-cycle-length", "0"}), 2);
    EXPECT_NE(err_.str().find("max_cycle_length"), std::string::npos);
}

TEST_F(CliTest, MissingFileExitsOne) {
    EXPECT_EQ(run({dataFile("no_such_file.txt")}), 1);
    EXPECT_NE(err_.str().find("cannot open"), std::string::npos);
}

TEST_F(CliTest, MalformedFileExitsOne) {
    EXPECT_EQ(run({dataFile("malformed_intents.txt")}), 1);
    EXPECT_NE(err_.str().find("Line 2"), std::string::npos);
}

TEST_F(CliTest, ExplorationLimitExitsOne) {
    EXPECT_EQ(run({"--max-cycles", "1", "--log-level", "off"}), 1);
    EXPECT_NE(err_.str().find("exploration limit exceeded"), std::string::npos);
}
