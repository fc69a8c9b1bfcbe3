#include "archive/TarWriter.hpp"
#include "archive/TarReader.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

using namespace ts::archive;

namespace {

constexpr std::size_t COPY_CHUNK = 32 * 1024;
constexpr int64_t MODE_MASK = 07777777;

uint64_t paddingFor(const uint64_t size) { return (BLOCK_SIZE - size % BLOCK_SIZE) % BLOCK_SIZE; }

std::string baseName(std::string path) {
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (const auto slash = path.rfind('/'); slash != std::string::npos) return path.substr(slash + 1);
    return path;
}

}

TarWriter::TarWriter(std::ostream& out) : out_(out) {}

void TarWriter::writeHeader(const Entry& entry) {
    if (closed_) throw std::logic_error("tar: header written after close");
    if (entry.name.empty()) throw std::invalid_argument("tar: entry has no name");
    if (entry.size < 0) throw std::invalid_argument("tar: negative size for " + entry.name);

    finishEntry();

    Block block{};
    std::string records;

    const auto overflow = [&](const std::string& key, const std::string& value) {
        if (!entry.pax.contains(key)) records += pax::record(key, value);
    };

    if (entry.name.size() <= field::NAME.width) {
        header::putString(block, field::NAME, entry.name);
    } else if (const auto split = header::splitUstarPath(entry.name)) {
        header::putString(block, field::PREFIX, split->first);
        header::putString(block, field::NAME, split->second);
    } else {
        overflow("path", entry.name);
        header::putString(block, field::NAME, entry.name.substr(0, field::NAME.width));
    }

    if (entry.linkname.size() > field::LINKNAME.width) overflow("linkpath", entry.linkname);
    header::putString(block, field::LINKNAME, entry.linkname);

    if (!header::putOctal(block, field::MODE, entry.mode & MODE_MASK)) header::putBase256(block, field::MODE, entry.mode);

    const auto numeric = [&](const field::Span span, const int64_t value, const std::string& key) {
        if (header::putOctal(block, span, value)) return;
        overflow(key, std::to_string(value));
        (void)header::putOctal(block, span, 0);
    };
    numeric(field::UID, entry.uid, "uid");
    numeric(field::GID, entry.gid, "gid");
    numeric(field::SIZE, entry.size, "size");
    numeric(field::MTIME, entry.mtime, "mtime");

    if (entry.uname.size() > field::UNAME.width) overflow("uname", entry.uname);
    if (entry.gname.size() > field::GNAME.width) overflow("gname", entry.gname);
    header::putString(block, field::UNAME, entry.uname);
    header::putString(block, field::GNAME, entry.gname);

    if (!header::putOctal(block, field::DEVMAJOR, entry.devmajor)) header::putBase256(block, field::DEVMAJOR, entry.devmajor);
    if (!header::putOctal(block, field::DEVMINOR, entry.devminor)) header::putBase256(block, field::DEVMINOR, entry.devminor);

    block[field::TYPEFLAG.offset] = entry.typeflag;
    header::putString(block, field::MAGIC, std::string_view("ustar\0", 6));
    header::putString(block, field::VERSION, "00");

    for (const auto& [key, value] : entry.pax) records += pax::record(key, value);
    if (!records.empty()) writePaxHeader(entry, records);

    header::stampChecksum(block);
    writeRaw(block.data(), block.size());

    remaining_ = static_cast<uint64_t>(entry.size);
    padding_ = paddingFor(remaining_);
}

void TarWriter::write(const char* data, const std::size_t size) {
    if (size > remaining_) throw std::runtime_error("tar: payload exceeds declared entry size");
    writeRaw(data, size);
    remaining_ -= size;
}

uint64_t TarWriter::copyFrom(TarReader& reader) {
    std::vector<char> buffer(COPY_CHUNK);
    uint64_t total = 0;
    while (const auto n = reader.read(buffer.data(), buffer.size())) {
        write(buffer.data(), n);
        total += n;
    }
    return total;
}

uint64_t TarWriter::copyFrom(std::istream& in, uint64_t bytes) {
    std::vector<char> buffer(COPY_CHUNK);
    uint64_t total = 0;
    while (bytes > 0) {
        const auto want = static_cast<std::size_t>(std::min<uint64_t>(bytes, buffer.size()));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        if (in.gcount() != static_cast<std::streamsize>(want)) throw std::runtime_error("tar: source shorter than declared entry size");
        write(buffer.data(), want);
        bytes -= want;
        total += want;
    }
    return total;
}

void TarWriter::close() {
    if (closed_) return;
    finishEntry();

    const Block zero{};
    writeRaw(zero.data(), zero.size());
    writeRaw(zero.data(), zero.size());
    out_.flush();
    if (!out_) throw std::runtime_error("tar: flush failed");
    closed_ = true;
}

void TarWriter::finishEntry() {
    if (remaining_ > 0) throw std::runtime_error("tar: entry payload incomplete, " + std::to_string(remaining_) + " bytes missing");
    if (padding_ > 0) {
        const Block zero{};
        writeRaw(zero.data(), static_cast<std::size_t>(padding_));
        padding_ = 0;
    }
}

void TarWriter::writePaxHeader(const Entry& entry, const std::string& records) {
    Block block{};
    header::putString(block, field::NAME, ("PaxHeaders.0/" + baseName(entry.name)).substr(0, field::NAME.width));
    (void)header::putOctal(block, field::MODE, 0644);
    (void)header::putOctal(block, field::UID, 0);
    (void)header::putOctal(block, field::GID, 0);
    (void)header::putOctal(block, field::SIZE, static_cast<int64_t>(records.size()));
    if (!header::putOctal(block, field::MTIME, entry.mtime)) (void)header::putOctal(block, field::MTIME, 0);
    block[field::TYPEFLAG.offset] = typeflag::PAX_LOCAL;
    header::putString(block, field::MAGIC, std::string_view("ustar\0", 6));
    header::putString(block, field::VERSION, "00");
    header::stampChecksum(block);

    writeRaw(block.data(), block.size());
    writeRaw(records.data(), records.size());

    const Block zero{};
    writeRaw(zero.data(), static_cast<std::size_t>(paddingFor(records.size())));
}

void TarWriter::writeRaw(const char* data, const std::size_t size) {
    if (size == 0) return;
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) throw std::runtime_error("tar: write failed");
}
