#include "archive/ArchiveStore.hpp"
#include "archive/TarReader.hpp"
#include "crypto/DigestFilter.hpp"
#include "sync/RegularFileCounter.hpp"
#include "log/Registry.hpp"

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>

using namespace ts::archive;
using namespace ts::crypto;
using namespace ts::log;

namespace io = boost::iostreams;

namespace {

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const auto hi = hexValue(in[i + 1]);
            const auto lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

}

ArchiveStore::ArchiveStore(std::filesystem::path root) : root_(std::move(root)) {
    if (root_.empty()) throw std::invalid_argument("ArchiveStore: archive root must not be empty");
}

std::optional<std::filesystem::path> ArchiveStore::resolve(std::string_view target) const {
    if (const auto q = target.find_first_of("?#"); q != std::string_view::npos) target = target.substr(0, q);

    auto path = percentDecode(target);
    while (!path.empty() && path.back() == '/') path.pop_back();

    std::string name = path;
    if (const auto slash = path.rfind('/'); slash != std::string::npos) name = path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") return std::nullopt;

    auto resolved = root_ / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolved, ec)) return std::nullopt;
    return resolved;
}

ArchiveInfo ArchiveStore::inspect(const std::filesystem::path& archive) {
    std::ifstream file(archive, std::ios::binary);
    if (!file.is_open()) throw std::runtime_error("Failed to open archive " + archive.string());

    const auto hasher = std::make_shared<Sha1Hasher>();
    io::filtering_istream in;
    in.push(DigestFilter(hasher));
    in.push(io::gzip_decompressor());
    in.push(file);
    in.exceptions(std::ios::badbit);

    ArchiveInfo info;
    TarReader reader(in);
    sync::RegularFileCounter counter;
    while (const auto entry = reader.next()) {
        ++info.entries;
        counter.assign(*entry);
    }

    // trailing blocks after the end marker count towards the fingerprint too
    std::array<char, 8192> buffer{};
    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {}

    info.regularFiles = counter.assigned();
    info.fingerprint = toHex(hasher->finish());

    Registry::archive()->debug("[ArchiveStore] {}: {} entries, {} regular files, fingerprint {}",
                               archive.string(), info.entries, info.regularFiles, info.fingerprint);
    return info;
}

ArchiveInfo ArchiveStore::info(const std::filesystem::path& archive) const {
    // stat before reading so a rewrite during inspect() invalidates the entry
    const auto size = std::filesystem::file_size(archive);
    const auto mtime = std::filesystem::last_write_time(archive);
    const auto key = archive.string();

    {
        std::shared_lock lock(mutex_);
        if (const auto it = cache_.find(key); it != cache_.end() && it->second.size == size && it->second.mtime == mtime)
            return it->second.info;
    }

    auto fresh = inspect(archive);

    std::unique_lock lock(mutex_);
    cache_[key] = {size, mtime, fresh};
    return fresh;
}
