#include "vfs/diff_engine.hpp"

namespace halon::vfs {

namespace {

bool same_content(const pack::FileInfo& a, const pack::FileInfo& b) {
    return a.uncompressed_size == b.uncompressed_size &&
           a.compressed_size == b.compressed_size && a.sha1 == b.sha1;
}

void diff_nodes(const Node& a, const Node& b, DiffCounts& counts) {
    if (a.is_file() && b.is_file()) {
        if (!same_content(*a.file_info(), *b.file_info())) {
            counts.changed++;
        }
        return;
    }

    if (a.kind() != b.kind()) {
        counts.removed += a.file_count();
        counts.added += b.file_count();
        return;
    }

    for (const auto& child : a.children()) {
        if (const Node* other = b.child(child->name())) {
            diff_nodes(*child, *other, counts);
        } else {
            counts.removed += child->file_count();
        }
    }
    for (const auto& child : b.children()) {
        if (!a.child(child->name())) {
            counts.added += child->file_count();
        }
    }
}

} // namespace

const DiffCounts* DiffReport::find(std::string_view name) const {
    for (const auto& entry : entries) {
        if (entry.name == name) return &entry.counts;
    }
    return nullptr;
}

DiffCounts DiffReport::total() const {
    DiffCounts sum;
    for (const auto& entry : entries) {
        sum.removed += entry.counts.removed;
        sum.added += entry.counts.added;
        sum.changed += entry.counts.changed;
    }
    return sum;
}

DiffReport diff(const Node& a, const Node& b) {
    DiffReport report;

    if (!a.is_directory() || !b.is_directory()) {
        DiffEntry entry;
        entry.name = a.name();
        diff_nodes(a, b, entry.counts);
        report.entries.push_back(std::move(entry));
        return report;
    }

    for (const auto& child : a.children()) {
        DiffEntry entry;
        entry.name = child->name();
        if (const Node* other = b.child(child->name())) {
            diff_nodes(*child, *other, entry.counts);
        } else {
            entry.counts.removed = child->file_count();
        }
        report.entries.push_back(std::move(entry));
    }
    for (const auto& child : b.children()) {
        if (a.child(child->name())) continue;
        DiffEntry entry;
        entry.name = child->name();
        entry.counts.added = child->file_count();
        report.entries.push_back(std::move(entry));
    }

    return report;
}

} // namespace halon::vfs
