#include "app/cli_options.hpp"

#include <cstring>

namespace halon::app {

namespace {

struct CommandInfo {
    const char* name;
    Command command;
    size_t min_args;
    size_t max_args;
};

constexpr CommandInfo COMMANDS[] = {
    {"find", Command::Find, 1, 1},
    {"list", Command::List, 0, 1},
    {"extract", Command::Extract, 0, 2},
    {"diff", Command::Diff, 1, 2},
    {"verify", Command::Verify, 0, 1},
    {"info", Command::Info, 0, 0},
};

Error usage_error(std::string message) {
    return Error(ErrorCode::InvalidArgument, std::move(message));
}

} // namespace

void print_usage(std::ostream& out) {
    out << "Halon v0.1.0\n"
        << "Explore and extract directories and files inside .index/.archive "
           "pairs.\n\n"
        << "Usage:\n"
        << "  halon [options] <archive> <command> [args]\n\n"
        << "Commands:\n"
        << "  find <name>                  Print every path containing <name>\n"
        << "  list [path]                  List a directory (default: root)\n"
        << "  extract [path] [dest]        Extract a node into dest (default: .)\n"
        << "  diff <other_archive> [path]  Count removed/added/changed files\n"
        << "                               per top-level entry\n"
        << "  verify [path]                Check SHA-1 of every file under path\n"
        << "  info                         Print index and archive headers\n\n"
        << "Options:\n"
        << "  -r, --recursive     List whole subtrees\n"
        << "  -d, --debug         Show node details and debug logging\n"
        << "  -i, --ignore-case   Case-insensitive path lookups\n"
        << "  --log-file <path>   Also write the log to <path>\n"
        << "  -h, --help          Show this help message\n";
}

Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-r") == 0 ||
            std::strcmp(argv[i], "--recursive") == 0) {
            options.recursive = true;
        } else if (std::strcmp(argv[i], "-d") == 0 ||
                   std::strcmp(argv[i], "--debug") == 0) {
            options.debug = true;
        } else if (std::strcmp(argv[i], "-i") == 0 ||
                   std::strcmp(argv[i], "--ignore-case") == 0) {
            options.ignore_case = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 >= argc) {
                return usage_error("--log-file needs a path");
            }
            options.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            options.help = true;
            return options;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            return usage_error(std::string("Unknown option: ") + argv[i]);
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.size() < 2) {
        return usage_error("Expected <archive> <command>");
    }
    options.archive = positional[0];

    const CommandInfo* info = nullptr;
    for (const auto& candidate : COMMANDS) {
        if (positional[1] == candidate.name) {
            info = &candidate;
            break;
        }
    }
    if (!info) {
        return usage_error("Unknown command: " + positional[1]);
    }

    options.command = info->command;
    options.args.assign(positional.begin() + 2, positional.end());
    if (options.args.size() < info->min_args ||
        options.args.size() > info->max_args) {
        return usage_error(std::string("Wrong number of arguments for '") +
                           info->name + "'");
    }

    return options;
}

} // namespace halon::app
