#include "cli/cli_mode.hpp"
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    CliMode cli;
    return cli.run(args);
}
