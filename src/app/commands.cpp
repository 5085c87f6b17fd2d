#include "app/commands.hpp"
#include "vfs/filesystem.hpp"

#include <ctime>
#include <spdlog/spdlog.h>

namespace halon::app {

namespace {

/// 100ns ticks between 1601-01-01 and 1970-01-01.
constexpr u64 FILETIME_UNIX_EPOCH = 116444736000000000ull;

void print_node(std::ostream& out, const vfs::Node& node, bool debug) {
    if (debug) {
        out << describe_node(node) << "\n";
    } else {
        out << node.path() << "\n";
    }
}

Result<void> run_find(const vfs::Filesystem& filesystem,
                      const CliOptions& options, std::ostream& out) {
    size_t matches = 0;
    for (const vfs::Node* node : filesystem.find(options.arg(0))) {
        print_node(out, *node, options.debug);
        matches++;
    }
    spdlog::debug("find '{}': {} matches", options.arg(0), matches);
    return {};
}

Result<void> run_list(const vfs::Filesystem& filesystem,
                      const CliOptions& options, std::ostream& out) {
    auto node = filesystem.resolve(options.arg(0));
    if (!node) return node.error();

    for (const vfs::Node* item :
         filesystem.list(*node.value(), options.recursive)) {
        print_node(out, *item, options.debug);
    }
    return {};
}

Result<void> run_extract(const vfs::Filesystem& filesystem,
                         const CliOptions& options, std::ostream& out) {
    auto node = filesystem.resolve(options.arg(0));
    if (!node) return node.error();

    fs::path destination = options.arg(1, ".");
    auto stats = filesystem.extract(*node.value(), destination);
    if (!stats) return stats.error();

    out << "Extracted " << stats.value().files << " files ("
        << stats.value().bytes << " bytes) to " << destination.string()
        << "\n";
    return {};
}

Result<void> run_diff(const vfs::Filesystem& filesystem,
                      const CliOptions& options, std::ostream& out) {
    vfs::FilesystemOptions fs_options;
    fs_options.lookup.case_sensitive = !options.ignore_case;

    auto other = vfs::Filesystem::open(options.arg(0), fs_options);
    if (!other) return other.error();

    auto report = filesystem.diff(other.value(), options.arg(1));
    if (!report) return report.error();

    for (const auto& entry : report.value().entries) {
        out << entry.name << ": " << entry.counts.removed << " removed, "
            << entry.counts.added << " added, " << entry.counts.changed
            << " changed\n";
    }
    return {};
}

Result<void> run_verify(const vfs::Filesystem& filesystem,
                        const CliOptions& options, std::ostream& out) {
    auto node = filesystem.resolve(options.arg(0));
    if (!node) return node.error();

    auto verified = filesystem.verify(*node.value());
    if (!verified) return verified.error();

    out << verified.value() << " files verified\n";
    return {};
}

void run_info(const vfs::Filesystem& filesystem, std::ostream& out) {
    const auto& root = filesystem.index_root();
    out << "Index " << filesystem.base_path().string() << ".index:\n"
        << describe_header(filesystem.index_header())
        << "\tRoot directory block: " << root.root_directory_block << "\n"
        << "\tEntries: " << filesystem.entry_count() << "\n"
        << "\tUnknowns: [" << filesystem.index_header().unknown1 << ", "
        << filesystem.index_header().unknown2 << ", " << root.unknown << "]\n";

    const auto& archive = filesystem.archive();
    out << "Archive " << archive.path().string() << ":\n"
        << describe_header(archive.header())
        << "\tPayload entries: " << archive.entry_count() << "\n"
        << "\tUnknowns: [" << archive.header().unknown1 << ", "
        << archive.header().unknown2 << "]\n";
}

} // namespace

std::string format_filetime(u64 filetime) {
    if (filetime < FILETIME_UNIX_EPOCH) return "-";

    std::time_t seconds =
        static_cast<std::time_t>((filetime - FILETIME_UNIX_EPOCH) / 10000000ull);
    std::tm* tm = std::gmtime(&seconds);
    if (!tm) return "-";

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", tm);
    return buffer;
}

std::string describe_header(const pack::PackHeader& header) {
    return "\tMagic: " + pack::magic_string(header.magic) + "\n" +
           "\tVersion: " + std::to_string(header.version) + "\n" +
           "\tFilesize: " + std::to_string(header.file_size) + " bytes\n" +
           "\tBlocks: " + std::to_string(header.block_count) + "\n";
}

std::string describe_node(const vfs::Node& node) {
    if (node.is_directory()) {
        return "Directory " + node.path() + ":\n" +
               "\tBlock index: " + std::to_string(node.block_index()) + "\n" +
               "\tChildren: " + std::to_string(node.children().size());
    }

    const auto& info = *node.file_info();
    return "File " + node.path() + ":\n" +
           "\tCompression type: " + pack::compression_name(info.compression) +
           " (" + std::to_string(info.compression) + ")\n" +
           "\tUncompressed size: " + std::to_string(info.uncompressed_size) +
           " bytes\n" +
           "\tCompressed size: " + std::to_string(info.compressed_size) +
           " bytes\n" +
           "\tSHA1 hash: " + to_hex(info.sha1) + "\n" +
           "\tWrite time: " + format_filetime(info.write_time);
}

Result<void> run_command(const CliOptions& options, std::ostream& out) {
    vfs::FilesystemOptions fs_options;
    fs_options.lookup.case_sensitive = !options.ignore_case;

    auto opened = vfs::Filesystem::open(options.archive, fs_options);
    if (!opened) return opened.error();
    const auto& filesystem = opened.value();

    switch (options.command) {
    case Command::Find: return run_find(filesystem, options, out);
    case Command::List: return run_list(filesystem, options, out);
    case Command::Extract: return run_extract(filesystem, options, out);
    case Command::Diff: return run_diff(filesystem, options, out);
    case Command::Verify: return run_verify(filesystem, options, out);
    case Command::Info:
        run_info(filesystem, out);
        return {};
    }
    return {};
}

} // namespace halon::app
