#include "archive/Gzip.hpp"

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include <array>
#include <stdexcept>

using namespace ts::archive;
namespace io = boost::iostreams;

namespace {

io::gzip_params paramsFor(const int level) {
    if (level < 0 || level > 9) throw std::invalid_argument("gzip: compression level must be 0-9, got " + std::to_string(level));
    return io::gzip_params(level);
}

std::unique_ptr<std::ifstream> openIn(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) throw std::runtime_error("Failed to open " + path.string());
    return file;
}

std::unique_ptr<std::ofstream> openOut(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!file->is_open()) throw std::runtime_error("Failed to create " + path.string());
    return file;
}

}

GzipReader::GzipReader(std::istream& source) {
    in_.push(io::gzip_decompressor());
    in_.push(source);
    in_.exceptions(std::ios::badbit);
}

GzipReader::GzipReader(const std::filesystem::path& path) : file_(openIn(path)) {
    in_.push(io::gzip_decompressor());
    in_.push(*file_);
    in_.exceptions(std::ios::badbit);
}

GzipWriter::GzipWriter(std::ostream& sink, const int level) {
    out_.push(io::gzip_compressor(paramsFor(level)));
    out_.push(sink);
    out_.exceptions(std::ios::badbit);
}

GzipWriter::GzipWriter(const std::filesystem::path& path, const int level) : file_(openOut(path)) {
    out_.push(io::gzip_compressor(paramsFor(level)));
    out_.push(*file_);
    out_.exceptions(std::ios::badbit);
}

void GzipWriter::finish() {
    if (finished_) return;
    finished_ = true;

    out_.flush();
    out_.reset();

    if (file_) {
        file_->close();
        if (file_->fail()) throw std::runtime_error("gzip: failed to finish output file");
    }
}

std::string ts::archive::gzipCompress(const std::string_view data, const int level) {
    std::string out;
    io::filtering_ostream os;
    os.push(io::gzip_compressor(paramsFor(level)));
    os.push(io::back_inserter(out));
    os.exceptions(std::ios::badbit);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    os.reset();
    return out;
}

std::string ts::archive::gzipDecompress(const std::string_view data, const uintmax_t maxBytes) {
    std::string out;
    try {
        io::filtering_istream is;
        is.push(io::gzip_decompressor());
        is.push(io::array_source(data.data(), data.size()));
        is.exceptions(std::ios::badbit);

        std::array<char, 8192> buffer{};
        while (is.read(buffer.data(), buffer.size()) || is.gcount() > 0) {
            out.append(buffer.data(), static_cast<std::size_t>(is.gcount()));
            if (out.size() > maxBytes)
                throw std::runtime_error("gzip: inflated data exceeds " + std::to_string(maxBytes) + " bytes");
        }
    } catch (const io::gzip_error& e) {
        throw std::runtime_error(std::string("gzip: malformed input: ") + e.what());
    } catch (const std::ios::failure& e) {
        throw std::runtime_error(std::string("gzip: read failed: ") + e.what());
    }
    return out;
}
