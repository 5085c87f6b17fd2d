#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace halon::app {

enum class Command { Find, List, Extract, Diff, Verify, Info };

/// Parsed command line.
struct CliOptions {
    fs::path archive;               ///< Base path of the index/archive pair
    Command command = Command::List;
    std::vector<std::string> args;  ///< Positional arguments after the command
    bool recursive = false;         ///< -r: list whole subtrees
    bool debug = false;             ///< -d: node details + debug logging
    bool ignore_case = false;       ///< -i: case-insensitive lookups
    bool help = false;
    fs::path log_file;              ///< --log-file: extra log sink

    /// Positional argument i, or fallback when absent.
    std::string arg(size_t i, const std::string& fallback = {}) const {
        return i < args.size() ? args[i] : fallback;
    }
};

Result<CliOptions> parse_args(int argc, char* argv[]);

void print_usage(std::ostream& out);

} // namespace halon::app
