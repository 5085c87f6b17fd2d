#pragma once

#include "app/cli_options.hpp"
#include "core/result.hpp"
#include "pack/pack_file.hpp"
#include "vfs/node.hpp"

#include <ostream>
#include <string>

namespace halon::app {

/// Execute the parsed command, writing listings to out.
Result<void> run_command(const CliOptions& options, std::ostream& out);

/// Node details printed in --debug mode.
std::string describe_node(const vfs::Node& node);

/// "YYYY-MM-DD HH:MM:SS" (UTC) for a Windows FILETIME, or "-" for zero.
std::string format_filetime(u64 filetime);

std::string describe_header(const pack::PackHeader& header);

} // namespace halon::app
