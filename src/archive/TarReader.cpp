#include "archive/TarReader.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <stdexcept>

using namespace ts::archive;

namespace {

constexpr int64_t MAX_EXTENSION_SIZE = 1 << 20;
constexpr std::size_t DISCARD_CHUNK = 32 * 1024;

uint64_t paddingFor(const uint64_t size) { return (BLOCK_SIZE - size % BLOCK_SIZE) % BLOCK_SIZE; }

bool isHeaderOnly(const char flag) {
    switch (flag) {
        case typeflag::HARDLINK:
        case typeflag::SYMLINK:
        case '3': // char device
        case '4': // block device
        case typeflag::DIRECTORY:
        case '6': // fifo
            return true;
        default:
            return false;
    }
}

int64_t parseDecimal(const std::string& key, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](const char c) { return c >= '0' && c <= '9'; }))
        throw std::runtime_error("tar: invalid PAX numeric record " + key + "=" + value);
    try {
        return std::stoll(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("tar: PAX numeric record out of range: " + key);
    }
}

std::string trimNul(std::string s) {
    if (const auto nul = s.find('\0'); nul != std::string::npos) s.resize(nul);
    return s;
}

}

TarReader::TarReader(std::istream& in) : in_(in) {}

std::optional<Entry> TarReader::next() {
    if (done_) return std::nullopt;

    discard(remaining_ + padding_);
    remaining_ = padding_ = 0;

    std::optional<std::string> longName, longLink;
    std::map<std::string, std::string> records;
    const auto pendingExtensions = [&] { return longName || longLink || !records.empty(); };

    Block block{};
    while (true) {
        if (!readBlock(block)) {
            done_ = true;
            if (pendingExtensions()) throw std::runtime_error("tar: archive ends after an extended header");
            return std::nullopt;
        }

        if (header::isZero(block)) {
            Block second{};
            if (readBlock(second) && !header::isZero(second))
                throw std::runtime_error("tar: invalid end-of-archive marker");
            done_ = true;
            if (pendingExtensions()) throw std::runtime_error("tar: archive ends after an extended header");
            return std::nullopt;
        }

        if (!header::verifyChecksum(block)) throw std::runtime_error("tar: header checksum mismatch");

        const char flag = block[field::TYPEFLAG.offset];
        const auto size = header::getNumeric(block, field::SIZE);
        if (size < 0) throw std::runtime_error("tar: negative entry size");

        if (flag == typeflag::PAX_LOCAL) {
            for (auto& [key, value] : pax::parse(readExtension(size))) records[key] = std::move(value);
            continue;
        }
        if (flag == typeflag::GNU_LONGNAME) {
            longName = trimNul(readExtension(size));
            continue;
        }
        if (flag == typeflag::GNU_LONGLINK) {
            longLink = trimNul(readExtension(size));
            continue;
        }

        const auto format = header::detectFormat(block);

        Entry entry;
        entry.typeflag = flag;
        entry.size = size;
        entry.name = header::getString(block, field::NAME);
        if (format == header::Format::Ustar) {
            if (const auto prefix = header::getString(block, field::PREFIX); !prefix.empty())
                entry.name = prefix + "/" + entry.name;
        }
        entry.mode = header::getNumeric(block, field::MODE);
        entry.uid = header::getNumeric(block, field::UID);
        entry.gid = header::getNumeric(block, field::GID);
        entry.mtime = header::getNumeric(block, field::MTIME);
        entry.linkname = header::getString(block, field::LINKNAME);
        if (format != header::Format::V7) {
            entry.uname = header::getString(block, field::UNAME);
            entry.gname = header::getString(block, field::GNAME);
            entry.devmajor = header::getNumeric(block, field::DEVMAJOR);
            entry.devminor = header::getNumeric(block, field::DEVMINOR);
        }

        if (longName) entry.name = *longName;
        if (longLink) entry.linkname = *longLink;

        for (auto& [key, value] : records) {
            if (key == "path") entry.name = value;
            else if (key == "linkpath") entry.linkname = value;
            else if (key == "size") entry.size = parseDecimal(key, value);
            else if (key == "uid") entry.uid = parseDecimal(key, value);
            else if (key == "gid") entry.gid = parseDecimal(key, value);
            else if (key == "uname") entry.uname = value;
            else if (key == "gname") entry.gname = value;
            else entry.pax.emplace(key, std::move(value));
        }

        if (entry.typeflag == typeflag::REGULAR_OLD)
            entry.typeflag = !entry.name.empty() && entry.name.back() == '/' ? typeflag::DIRECTORY : typeflag::REGULAR;

        if (isHeaderOnly(entry.typeflag)) entry.size = 0;

        remaining_ = static_cast<uint64_t>(entry.size);
        padding_ = paddingFor(remaining_);
        ++entries_;
        return entry;
    }
}

std::size_t TarReader::read(char* buffer, const std::size_t size) {
    const auto n = static_cast<std::size_t>(std::min<uint64_t>(size, remaining_));
    if (n == 0) return 0;
    readRaw(buffer, n);
    remaining_ -= n;
    return n;
}

void TarReader::readExact(char* buffer, const std::size_t size) {
    if (size > remaining_) throw std::runtime_error("tar: entry payload shorter than expected");
    readRaw(buffer, size);
    remaining_ -= size;
}

bool TarReader::readBlock(Block& block) {
    in_.read(block.data(), BLOCK_SIZE);
    if (in_.bad()) throw std::runtime_error("tar: read error");

    const auto got = in_.gcount();
    if (got == 0 && in_.eof()) return false;
    if (got != static_cast<std::streamsize>(BLOCK_SIZE)) throw std::runtime_error("tar: unexpected end of archive in header");
    return true;
}

void TarReader::readRaw(char* buffer, const std::size_t size) {
    in_.read(buffer, static_cast<std::streamsize>(size));
    if (in_.bad()) throw std::runtime_error("tar: read error");
    if (in_.gcount() != static_cast<std::streamsize>(size)) throw std::runtime_error("tar: unexpected end of archive");
}

void TarReader::discard(uint64_t bytes) {
    std::array<char, DISCARD_CHUNK> scratch{};
    while (bytes > 0) {
        const auto n = static_cast<std::size_t>(std::min<uint64_t>(bytes, scratch.size()));
        readRaw(scratch.data(), n);
        bytes -= n;
    }
}

std::string TarReader::readExtension(const int64_t size) {
    if (size > MAX_EXTENSION_SIZE) throw std::runtime_error("tar: extended header too large");

    std::string payload(static_cast<std::size_t>(size), '\0');
    readRaw(payload.data(), payload.size());
    discard(paddingFor(payload.size()));
    return payload;
}
