#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ts::sync {

// One bit per RegularFileCounter value, MSB first within each byte.
// A set bit means the client lacks that file.
class PresenceBitmap {
public:
    PresenceBitmap() = default;

    // Wraps bytes received over the wire; size() is then byteSize() * 8.
    static PresenceBitmap fromBytes(std::string bytes);

    // Minimum byte length able to address counters [0, regularFiles).
    static std::size_t bytesFor(uint64_t regularFiles) { return static_cast<std::size_t>((regularFiles + 7) / 8); }

    void push(bool missing);
    void set(uint64_t counter, bool missing);

    // Throws std::out_of_range when counter / 8 >= byteSize().
    [[nodiscard]] bool test(uint64_t counter) const;

    // Always at least one byte; unused low bits of the last byte are zero.
    [[nodiscard]] std::string pack() const;

    [[nodiscard]] uint64_t size() const { return bits_; }
    [[nodiscard]] std::size_t byteSize() const { return bytes_.size(); }
    [[nodiscard]] uint64_t countSet() const;
    [[nodiscard]] bool any() const { return countSet() > 0; }

private:
    std::vector<uint8_t> bytes_;
    uint64_t bits_ = 0;
};

}
