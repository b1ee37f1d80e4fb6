#pragma once
#include "Config.h"
#include <string>
#include <vector>
#include <functional>

namespace conn_tracker {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when the program should exit
    // without running: --help/--version (exit_code() == 0) or a usage error
    // (exit_code() == 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help() const;
    static void print_version();

private:
    enum class ArgKind { None, String, Int };
    struct FlagSpec {
        const char* name;
        const char* alias;
        ArgKind kind;
        const char* arg_help;
        const char* help;
        std::function<bool(const std::string&, Config&)> apply;
    };
    const FlagSpec* find_spec(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
};

}
