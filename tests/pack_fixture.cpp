#include "pack_fixture.hpp"
#include "core/sha1.hpp"
#include "pack/pack_file.hpp"
#include "vfs/path_resolver.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <lzma.h>
#include <random>
#include <stdexcept>
#include <zlib.h>

namespace halon::test {

Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Bytes compress_zlib(const Bytes& data) {
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    Bytes out(size);
    if (compress2(out.data(), &size, data.data(),
                  static_cast<uLong>(data.size()), Z_BEST_COMPRESSION) != Z_OK) {
        throw std::runtime_error("compress2 failed");
    }
    out.resize(size);
    return out;
}

Bytes compress_lzma(const Bytes& data) {
    lzma_options_lzma opt;
    if (lzma_lzma_preset(&opt, 1)) {
        throw std::runtime_error("lzma preset failed");
    }
    opt.ext_flags = 0; // no end marker, the size lives in the index

    lzma_filter filters[2] = {{LZMA_FILTER_LZMA1EXT, &opt},
                              {LZMA_VLI_UNKNOWN, nullptr}};
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_raw_encoder(&strm, filters) != LZMA_OK) {
        throw std::runtime_error("lzma encoder init failed");
    }

    Bytes stream(data.size() + data.size() / 2 + 1024);
    strm.next_in = data.data();
    strm.avail_in = data.size();
    strm.next_out = stream.data();
    strm.avail_out = stream.size();
    lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
    stream.resize(static_cast<size_t>(strm.total_out));
    lzma_end(&strm);
    if (ret != LZMA_STREAM_END) {
        throw std::runtime_error("lzma encode failed");
    }

    Bytes out;
    out.push_back(static_cast<u8>((opt.pb * 5 + opt.lp) * 9 + opt.lc));
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<u8>(opt.dict_size >> (8 * i)));
    }
    out.insert(out.end(), stream.begin(), stream.end());
    return out;
}

Sha1Digest sha1_of(const Bytes& data) {
    auto digest = sha1_digest(data);
    if (!digest) throw std::runtime_error(digest.error().message);
    return digest.value();
}

// --- ByteWriter ---

void ByteWriter::put_u32(u32 value) {
    for (int i = 0; i < 4; i++) data_.push_back(static_cast<u8>(value >> (8 * i)));
}

void ByteWriter::put_u64(u64 value) {
    for (int i = 0; i < 8; i++) data_.push_back(static_cast<u8>(value >> (8 * i)));
}

void ByteWriter::put_raw(const void* data, size_t size) {
    auto* p = static_cast<const u8*>(data);
    data_.insert(data_.end(), p, p + size);
}

// --- Raw layout ---

Bytes assemble_pack(const std::vector<Bytes>& blocks, u32 root_block) {
    u64 data_size = 0;
    for (const auto& block : blocks) data_size += block.size();
    const u64 table_offset = pack::PACK_HEADER_SIZE + data_size;
    const u64 file_size = table_offset + blocks.size() * pack::BLOCK_RECORD_SIZE;

    ByteWriter w;
    w.put_raw("KCAP", 4);
    w.put_u32(pack::PACK_VERSION);
    w.put_bytes(Bytes(512, 0));
    w.put_u64(file_size);
    w.put_u64(0);
    w.put_u64(table_offset);
    w.put_u32(static_cast<u32>(blocks.size()));
    w.put_u32(0);
    w.put_u32(root_block);

    for (const auto& block : blocks) w.put_bytes(block);

    u64 offset = pack::PACK_HEADER_SIZE;
    for (const auto& block : blocks) {
        w.put_u64(offset);
        w.put_u64(block.size());
        offset += block.size();
    }
    return w.take();
}

Bytes index_root_block(u32 root_directory_block) {
    ByteWriter w;
    w.put_raw("XDIA", 4);
    w.put_u32(1);
    w.put_u32(0);
    w.put_u32(root_directory_block);
    return w.take();
}

Bytes directory_block(
    const std::vector<std::pair<std::string, u32>>& dirs,
    const std::vector<std::pair<std::string, pack::FileInfo>>& files) {
    Bytes names;
    auto add_name = [&names](const std::string& name) {
        u32 offset = static_cast<u32>(names.size());
        names.insert(names.end(), name.begin(), name.end());
        names.push_back(0);
        return offset;
    };

    ByteWriter w;
    w.put_u32(static_cast<u32>(dirs.size()));
    w.put_u32(static_cast<u32>(files.size()));
    for (const auto& [name, block] : dirs) {
        w.put_u32(add_name(name));
        w.put_u32(block);
    }
    for (const auto& [name, info] : files) {
        w.put_u32(add_name(name));
        w.put_u32(info.compression);
        w.put_u64(info.write_time);
        w.put_u64(info.uncompressed_size);
        w.put_u64(info.compressed_size);
        w.put_raw(info.sha1.data(), info.sha1.size());
        w.put_u32(0);
    }
    w.put_bytes(names);
    return w.take();
}

// --- FixtureFile ---

Bytes FixtureFile::payload() const {
    switch (compression) {
    case pack::compression::ZLIB: return compress_zlib(content);
    case pack::compression::LZMA: return compress_lzma(content);
    default: return content;
    }
}

Sha1Digest FixtureFile::sha1() const {
    if (sha1_override) return *sha1_override;
    if (content.empty()) return Sha1Digest{};
    return sha1_of(content);
}

pack::FileInfo FixtureFile::info() const {
    pack::FileInfo info;
    info.compression = compression;
    info.write_time = write_time;
    info.uncompressed_size = content.size();
    info.compressed_size = payload().size();
    info.sha1 = sha1();
    return info;
}

// --- PackFixture ---

PackFixture::PackFixture() : root_(std::make_unique<Dir>()) {}

PackFixture::PackFixture(const PackFixture& other) : root_(clone(*other.root_)) {}

PackFixture& PackFixture::operator=(const PackFixture& other) {
    if (this != &other) root_ = clone(*other.root_);
    return *this;
}

std::unique_ptr<PackFixture::Dir> PackFixture::clone(const Dir& dir) {
    auto copy = std::make_unique<Dir>();
    copy->name = dir.name;
    copy->files = dir.files;
    for (const auto& sub : dir.dirs) copy->dirs.push_back(clone(*sub));
    return copy;
}

PackFixture::Dir* PackFixture::ensure_dir(
    const std::vector<std::string_view>& segments) {
    Dir* dir = root_.get();
    for (auto segment : segments) {
        Dir* next = nullptr;
        for (auto& sub : dir->dirs) {
            if (sub->name == segment) next = sub.get();
        }
        if (!next) {
            dir->dirs.push_back(std::make_unique<Dir>());
            next = dir->dirs.back().get();
            next->name = std::string(segment);
        }
        dir = next;
    }
    return dir;
}

void PackFixture::add_file(std::string_view path, const Bytes& content,
                           u32 compression) {
    auto segments = vfs::split_path(path);
    auto name = segments.back();
    segments.pop_back();

    FixtureFile file;
    file.name = std::string(name);
    file.content = content;
    file.compression = compression;
    file.write_time = 130500000000000000ull; // 2014-07-16
    ensure_dir(segments)->files.push_back(std::move(file));
}

void PackFixture::add_directory(std::string_view path) {
    ensure_dir(vfs::split_path(path));
}

FixtureFile* PackFixture::file(std::string_view path) {
    auto segments = vfs::split_path(path);
    auto name = segments.back();
    segments.pop_back();

    Dir* dir = root_.get();
    for (auto segment : segments) {
        Dir* next = nullptr;
        for (auto& sub : dir->dirs) {
            if (sub->name == segment) next = sub.get();
        }
        if (!next) return nullptr;
        dir = next;
    }
    for (auto& f : dir->files) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

u32 PackFixture::emit_directory(const Dir& dir, std::vector<Bytes>& blocks) {
    u32 id = static_cast<u32>(blocks.size());
    blocks.emplace_back();

    std::vector<std::pair<std::string, u32>> dir_records;
    for (const auto& sub : dir.dirs) {
        dir_records.emplace_back(sub->name, emit_directory(*sub, blocks));
    }
    std::vector<std::pair<std::string, pack::FileInfo>> file_records;
    for (const auto& f : dir.files) {
        file_records.emplace_back(f.name, f.info());
    }

    blocks[id] = directory_block(dir_records, file_records);
    return id;
}

Bytes PackFixture::build_index() const {
    std::vector<Bytes> blocks(1); // block 0: AIDX root
    u32 root_dir = emit_directory(*root_, blocks);
    blocks[0] = index_root_block(root_dir);
    return assemble_pack(blocks, 0);
}

Bytes PackFixture::build_archive() const {
    std::vector<Bytes> blocks(1); // block 0: AARC root
    ByteWriter table;
    u32 entry_count = 0;
    std::vector<Sha1Digest> seen;

    std::vector<const Dir*> pending = {root_.get()};
    while (!pending.empty()) {
        const Dir* dir = pending.back();
        pending.pop_back();
        for (const auto& sub : dir->dirs) pending.push_back(sub.get());

        for (const auto& f : dir->files) {
            if (f.content.empty()) continue;
            auto sha1 = f.sha1();
            bool duplicate = false;
            for (const auto& s : seen) duplicate = duplicate || s == sha1;
            if (duplicate) continue;
            seen.push_back(sha1);

            auto payload = f.payload();
            table.put_u32(static_cast<u32>(blocks.size()));
            table.put_raw(sha1.data(), sha1.size());
            table.put_u64(payload.size());
            blocks.push_back(std::move(payload));
            entry_count++;
        }
    }

    u32 table_block = static_cast<u32>(blocks.size());
    blocks.push_back(table.take());

    ByteWriter root;
    root.put_raw("CRAA", 4);
    root.put_u32(1);
    root.put_u32(entry_count);
    root.put_u32(table_block);
    blocks[0] = root.take();

    return assemble_pack(blocks, 0);
}

fs::path PackFixture::write(const fs::path& dir, const std::string& base) const {
    fs::path base_path = dir / base;
    write_bytes(fs::path(base_path.string() + ".index"), build_index());
    write_bytes(fs::path(base_path.string() + ".archive"), build_archive());
    return base_path;
}

PackFixture sample_fixture() {
    PackFixture fixture;
    fixture.add_file("UI/FloatText/FloatText.lua",
                     to_bytes("local FloatText = {}\n"
                              "function FloatText:OnLoad()\n"
                              "  self.wndMain = nil\n"
                              "end\n"),
                     pack::compression::LZMA);
    fixture.add_file("UI/FloatText/FloatTextPanel.lua",
                     to_bytes("-- panel\nlocal FloatTextPanel = {}\n"),
                     pack::compression::ZLIB);
    fixture.add_file("UI/FloatText/FloatTextPanel.xml",
                     to_bytes("<Forms><Form Name=\"FloatTextPanel\"/></Forms>\n"));
    fixture.add_file("UI/FloatText/TestFloatTextForms.xml",
                     to_bytes("<Forms><Form Name=\"Test\"/></Forms>\n"),
                     pack::compression::ZLIB);
    fixture.add_file("UI/FloatText/toc.xml",
                     to_bytes("<?xml version=\"1.0\" ?>\n"
                              "<Addon Author=\"Carbine\" APIVersion=\"9\">\n"
                              "  <Script Name=\"FloatText.lua\"/>\n"
                              "</Addon>\n"));
    fixture.add_file("UI/Tooltips/toc.xml",
                     to_bytes("<Addon Name=\"Tooltips\"/>\n"),
                     pack::compression::LZMA);
    fixture.add_directory("UI/Empty");
    fixture.add_file("DB/Creature2.tbl", Bytes(4096, 0x2a),
                     pack::compression::LZMA);
    fixture.add_file("DB/Spell4.tbl", to_bytes("DTBL spell data"));
    fixture.add_file("Art/Icons/readme.txt", to_bytes("icons\n"),
                     pack::compression::ZLIB);
    fixture.add_file("Art/blank.txt", Bytes{});
    return fixture;
}

// --- Files ---

TempDir::TempDir() {
    std::random_device rd;
    path_ = fs::temp_directory_path() /
            ("halon_test_" + std::to_string(rd()) + std::to_string(rd()));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_bytes(const fs::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("cannot write " + path.string());
}

Bytes read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + path.string());
    return Bytes(std::istreambuf_iterator<char>(in),
                 std::istreambuf_iterator<char>());
}

} // namespace halon::test
