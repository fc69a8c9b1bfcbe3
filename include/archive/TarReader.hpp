#pragma once

#include "archive/Entry.hpp"
#include "archive/TarHeader.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace ts::archive {

// Sequential tar decoder. next() positions the reader on the following entry,
// read() then yields that entry's payload. Unread payload is skipped by next().
class TarReader {
public:
    explicit TarReader(std::istream& in);

    std::optional<Entry> next();

    // Returns 0 once the current payload is exhausted.
    std::size_t read(char* buffer, std::size_t size);

    // Reads exactly size bytes of payload or throws.
    void readExact(char* buffer, std::size_t size);

    [[nodiscard]] uint64_t entriesRead() const { return entries_; }

private:
    bool readBlock(Block& block);
    void readRaw(char* buffer, std::size_t size);
    void discard(uint64_t bytes);
    std::string readExtension(int64_t size);

    std::istream& in_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
    uint64_t entries_ = 0;
    bool done_ = false;
};

}
