// Command-line driver: reads intents, nets them, prints the residual.

#include "cli/cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return netclear::runCli(args, std::cout, std::cerr);
}
