#include "vfs/extractor.hpp"
#include "core/file_io.hpp"

#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace halon::vfs {

namespace {

Result<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error(ErrorCode::IoFailure,
                     "Failed to create directory " + dir.string() + ": " +
                         ec.message());
    }
    return {};
}

/// Join a node name onto dir, refusing names that would leave it.
Result<fs::path> child_target(const fs::path& dir, const Node& child) {
    if (!is_valid_name(child.name())) {
        return Error(ErrorCode::CorruptIndex,
                     "Refusing to extract '" + child.path() +
                         "': name escapes " + dir.string());
    }
    return dir / child.name();
}

} // namespace

Result<ExtractStats> extract(const Node& node,
                             const pack::ArchiveReader& archive,
                             const fs::path& destination) {
    ExtractStats stats;

    std::vector<std::pair<const Node*, fs::path>> stack;
    if (node.name().empty()) {
        stack.emplace_back(&node, destination);
    } else {
        auto target = child_target(destination, node);
        if (!target) return target.error();
        stack.emplace_back(&node, std::move(target.value()));
    }

    while (!stack.empty()) {
        auto [current, target] = std::move(stack.back());
        stack.pop_back();

        if (current->is_directory()) {
            auto made = ensure_directory(target);
            if (!made) return made.error();
            stats.directories++;

            const auto& children = current->children();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                auto child = child_target(target, **it);
                if (!child) return child.error();
                stack.emplace_back(it->get(), std::move(child.value()));
            }
            continue;
        }

        auto parent = ensure_directory(target.parent_path());
        if (!parent) return parent.error();

        auto data = archive.read(*current->file_info());
        if (!data) {
            return Error(data.error().code,
                         current->path() + ": " + data.error().message);
        }

        auto written = write_file(target, data.value());
        if (!written) return written.error();

        spdlog::debug("Extracted {} ({} bytes)", current->path(),
                      data.value().size());
        stats.files++;
        stats.bytes += data.value().size();
    }

    return stats;
}

} // namespace halon::vfs
