#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/iostreams/filtering_stream.hpp>

namespace ts::archive {

constexpr int DEFAULT_COMPRESSION_LEVEL = 6;

// Decompressing view over a gzip stream or file.
class GzipReader {
public:
    explicit GzipReader(std::istream& source);
    explicit GzipReader(const std::filesystem::path& path);

    std::istream& stream() { return in_; }

private:
    std::unique_ptr<std::ifstream> file_;
    boost::iostreams::filtering_istream in_;
};

// Compressing stream. Call finish() to write the gzip trailer and surface
// errors; destruction completes the chain too but cannot report failures.
class GzipWriter {
public:
    GzipWriter(std::ostream& sink, int level = DEFAULT_COMPRESSION_LEVEL);
    GzipWriter(const std::filesystem::path& path, int level = DEFAULT_COMPRESSION_LEVEL);

    std::ostream& stream() { return out_; }

    void finish();

private:
    std::unique_ptr<std::ofstream> file_;
    boost::iostreams::filtering_ostream out_;
    bool finished_ = false;
};

std::string gzipCompress(std::string_view data, int level = DEFAULT_COMPRESSION_LEVEL);

// Throws std::runtime_error on malformed input or when the inflated size
// exceeds maxBytes.
std::string gzipDecompress(std::string_view data, uintmax_t maxBytes);

}
