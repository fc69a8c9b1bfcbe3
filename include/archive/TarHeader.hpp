#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ts::archive {

constexpr std::size_t BLOCK_SIZE = 512;
using Block = std::array<char, BLOCK_SIZE>;

// Byte layout of a POSIX ustar header block.
namespace field {
struct Span { std::size_t offset; std::size_t width; };
constexpr Span NAME     {  0, 100};
constexpr Span MODE     {100,   8};
constexpr Span UID      {108,   8};
constexpr Span GID      {116,   8};
constexpr Span SIZE     {124,  12};
constexpr Span MTIME    {136,  12};
constexpr Span CHKSUM   {148,   8};
constexpr Span TYPEFLAG {156,   1};
constexpr Span LINKNAME {157, 100};
constexpr Span MAGIC    {257,   6};
constexpr Span VERSION  {263,   2};
constexpr Span UNAME    {265,  32};
constexpr Span GNAME    {297,  32};
constexpr Span DEVMAJOR {329,   8};
constexpr Span DEVMINOR {337,   8};
constexpr Span PREFIX   {345, 155};
}

namespace header {

enum class Format { V7, Ustar, Gnu };

[[nodiscard]] bool isZero(const Block& block);
[[nodiscard]] Format detectFormat(const Block& block);

// Sum of all header bytes with the checksum field counted as spaces.
[[nodiscard]] uint32_t checksum(const Block& block);
[[nodiscard]] bool verifyChecksum(const Block& block);
void stampChecksum(Block& block);

[[nodiscard]] std::string getString(const Block& block, field::Span span);
void putString(Block& block, field::Span span, std::string_view value);

// Octal ASCII or GNU base-256. Throws std::runtime_error on garbage.
[[nodiscard]] int64_t getNumeric(const Block& block, field::Span span);
// Returns false when the value does not fit as octal.
[[nodiscard]] bool putOctal(Block& block, field::Span span, int64_t value);
void putBase256(Block& block, field::Span span, int64_t value);

// Splits a long path over the ustar prefix and name fields.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> splitUstarPath(const std::string& path);

}

namespace pax {

[[nodiscard]] std::map<std::string, std::string> parse(std::string_view payload);
[[nodiscard]] std::string record(const std::string& key, const std::string& value);

}

}
