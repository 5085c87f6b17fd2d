#include "app/cli_options.hpp"
#include "app/commands.hpp"
#include "core/log.hpp"

#include <iostream>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    auto parsed = halon::app::parse_args(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << "\n\n";
        halon::app::print_usage(std::cerr);
        return 1;
    }
    const auto& options = parsed.value();

    if (options.help) {
        halon::app::print_usage(std::cout);
        return 0;
    }

    try {
        halon::log::init(options.debug ? spdlog::level::debug
                                       : spdlog::level::warn,
                         options.log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: cannot initialize logging: " << e.what() << "\n";
        return 1;
    }

    auto result = halon::app::run_command(options, std::cout);
    if (!result) {
        spdlog::error("{}", result.error().describe());
        halon::log::shutdown();
        return 1;
    }

    halon::log::shutdown();
    return 0;
}
