#pragma once
#include <iostream>
#include <string>
#include <vector>

class CliMode {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_ITEMS_FAILED = 1;   // job ran, some items failed or mismatched
    static constexpr int EXIT_ERROR = 2;          // usage error or the job could not run

    CliMode(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // args excludes the program name
    int run(const std::vector<std::string>& args);

private:
    int runCopy(const std::vector<std::string>& args);
    int runCheck(const std::vector<std::string>& args);
    void printHelp() const;

    std::ostream& out_;
    std::ostream& err_;
};
