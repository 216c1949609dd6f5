#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "Config.h"

namespace bacnet_scan {

// bacnet-scan [scan|diff|export] [flags] [inputs...]
class ArgumentParser {
public:
    // Returns false when the program should exit now: after --help or
    // --version (exit_code 0) or on a usage error (exit_code 2, message on
    // stderr). --config is applied before any other flag so flags override it.
    bool parse(int argc, char** argv, Config& cfg);

    const std::string& command() const { return command_; }
    const std::vector<std::string>& positional() const { return positional_; }
    int exit_code() const { return exit_code_; }

    static void print_help(std::ostream& os);
    static void print_version(std::ostream& os);
private:
    std::string command_ = "scan";
    std::vector<std::string> positional_;
    int exit_code_ = 0;
};

std::vector<std::string> split_csv(const std::string& s);

}
