#include "archive/TarHeader.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

using namespace ts::archive;

namespace {

bool isPadding(const char c) { return c == ' ' || c == '\0'; }

}

bool header::isZero(const Block& block) {
    return std::all_of(block.begin(), block.end(), [](const char c) { return c == '\0'; });
}

header::Format header::detectFormat(const Block& block) {
    const auto* magic = block.data() + field::MAGIC.offset;
    const auto* version = block.data() + field::VERSION.offset;
    if (std::memcmp(magic, "ustar\0", 6) == 0 && std::memcmp(version, "00", 2) == 0) return Format::Ustar;
    if (std::memcmp(magic, "ustar ", 6) == 0 && std::memcmp(version, " \0", 2) == 0) return Format::Gnu;
    return Format::V7;
}

uint32_t header::checksum(const Block& block) {
    uint32_t sum = 0;
    for (std::size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= field::CHKSUM.offset && i < field::CHKSUM.offset + field::CHKSUM.width) sum += ' ';
        else sum += static_cast<unsigned char>(block[i]);
    }
    return sum;
}

bool header::verifyChecksum(const Block& block) {
    int64_t stored = 0;
    try {
        stored = getNumeric(block, field::CHKSUM);
    } catch (const std::runtime_error&) {
        return false;
    }

    // Some historic writers summed signed chars.
    int64_t signedSum = 0;
    for (std::size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= field::CHKSUM.offset && i < field::CHKSUM.offset + field::CHKSUM.width) signedSum += ' ';
        else signedSum += static_cast<signed char>(block[i]);
    }

    return stored == static_cast<int64_t>(checksum(block)) || stored == signedSum;
}

void header::stampChecksum(Block& block) {
    const auto sum = checksum(block);
    // six digits, NUL, space
    (void)putOctal(block, {field::CHKSUM.offset, 7}, sum);
    block[field::CHKSUM.offset + 7] = ' ';
}

std::string header::getString(const Block& block, const field::Span span) {
    const auto* begin = block.data() + span.offset;
    const auto* end = std::find(begin, begin + span.width, '\0');
    return {begin, end};
}

void header::putString(Block& block, const field::Span span, const std::string_view value) {
    std::memcpy(block.data() + span.offset, value.data(), std::min(value.size(), span.width));
}

int64_t header::getNumeric(const Block& block, const field::Span span) {
    const auto* raw = reinterpret_cast<const unsigned char*>(block.data() + span.offset);

    if (raw[0] & 0x80) {
        const unsigned char inv = (raw[0] & 0x40) ? 0xff : 0x00;
        uint64_t x = 0;
        for (std::size_t i = 0; i < span.width; ++i) {
            unsigned char c = raw[i] ^ inv;
            if (i == 0) c &= 0x7f;
            if ((x >> 56) > 0) throw std::runtime_error("tar: base-256 numeric field overflows");
            x = (x << 8) | c;
        }
        if ((x >> 63) > 0) throw std::runtime_error("tar: base-256 numeric field overflows");
        return inv == 0xff ? ~static_cast<int64_t>(x) : static_cast<int64_t>(x);
    }

    std::string_view digits(block.data() + span.offset, span.width);
    while (!digits.empty() && isPadding(digits.front())) digits.remove_prefix(1);
    while (!digits.empty() && isPadding(digits.back())) digits.remove_suffix(1);

    int64_t value = 0;
    for (const char c : digits) {
        if (c < '0' || c > '7') throw std::runtime_error("tar: invalid octal numeric field");
        value = value * 8 + (c - '0');
    }
    return value;
}

bool header::putOctal(Block& block, const field::Span span, const int64_t value) {
    if (value < 0) return false;

    const std::size_t digits = span.width - 1;
    if (digits < 21 && static_cast<uint64_t>(value) >= (uint64_t{1} << (3 * digits))) return false;

    auto* out = block.data() + span.offset;
    auto v = static_cast<uint64_t>(value);
    for (std::size_t i = digits; i-- > 0;) {
        out[i] = static_cast<char>('0' + (v & 7));
        v >>= 3;
    }
    out[digits] = '\0';
    return true;
}

void header::putBase256(Block& block, const field::Span span, int64_t value) {
    auto* out = reinterpret_cast<unsigned char*>(block.data() + span.offset);
    for (std::size_t i = span.width; i-- > 0;) {
        out[i] = static_cast<unsigned char>(value & 0xff);
        value >>= 8;
    }
    out[0] |= 0x80;
}

std::optional<std::pair<std::string, std::string>> header::splitUstarPath(const std::string& path) {
    auto length = path.size();
    if (length <= field::NAME.width) return std::nullopt;

    if (length > field::PREFIX.width + 1) length = field::PREFIX.width + 1;
    else if (path[length - 1] == '/') --length;

    const auto slash = path.rfind('/', length - 1);
    if (slash == std::string::npos || slash == 0) return std::nullopt;

    const auto nameLen = path.size() - slash - 1;
    if (nameLen == 0 || nameLen > field::NAME.width || slash > field::PREFIX.width) return std::nullopt;

    return std::make_pair(path.substr(0, slash), path.substr(slash + 1));
}

std::map<std::string, std::string> pax::parse(std::string_view payload) {
    std::map<std::string, std::string> records;

    while (!payload.empty()) {
        const auto space = payload.find(' ');
        if (space == std::string_view::npos || space == 0) throw std::runtime_error("tar: malformed PAX record");

        std::size_t length = 0;
        for (const char c : payload.substr(0, space)) {
            if (c < '0' || c > '9') throw std::runtime_error("tar: malformed PAX record length");
            length = length * 10 + static_cast<std::size_t>(c - '0');
        }
        if (length <= space + 1 || length > payload.size()) throw std::runtime_error("tar: PAX record length out of range");

        const auto record = payload.substr(0, length);
        if (record.back() != '\n') throw std::runtime_error("tar: PAX record missing newline");

        const auto kv = record.substr(space + 1, length - space - 2);
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) throw std::runtime_error("tar: PAX record missing key");

        records[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
        payload.remove_prefix(length);
    }

    return records;
}

std::string pax::record(const std::string& key, const std::string& value) {
    constexpr std::size_t padding = 3; // ' ', '=', '\n'
    auto size = key.size() + value.size() + padding;
    size += std::to_string(size).size();

    auto out = std::to_string(size) + " " + key + "=" + value + "\n";
    if (out.size() != size) out = std::to_string(out.size()) + " " + key + "=" + value + "\n";
    return out;
}
