#pragma once

#include "archive/Entry.hpp"
#include "archive/TarHeader.hpp"

#include <cstdint>
#include <istream>
#include <ostream>

namespace ts::archive {

class TarReader;

// Sequential tar encoder. Every writeHeader() must be followed by exactly
// entry.size payload bytes before the next header or close().
class TarWriter {
public:
    explicit TarWriter(std::ostream& out);

    void writeHeader(const Entry& entry);
    void write(const char* data, std::size_t size);

    // Copies what is left of the reader's current payload.
    uint64_t copyFrom(TarReader& reader);
    uint64_t copyFrom(std::istream& in, uint64_t bytes);

    // Writes the end-of-archive marker. The underlying stream is not closed.
    void close();

    [[nodiscard]] bool isClosed() const { return closed_; }

private:
    void finishEntry();
    void writePaxHeader(const Entry& entry, const std::string& records);
    void writeRaw(const char* data, std::size_t size);

    std::ostream& out_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
    bool closed_ = false;
};

}
