#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ts::archive {

struct ArchiveInfo {
    uint64_t entries = 0;
    uint64_t regularFiles = 0;
    std::string fingerprint;  // hex SHA-1 of the decompressed tar stream
};

// Read-only view of the gzip'd tar archives served from one directory.
class ArchiveStore {
public:
    explicit ArchiveStore(std::filesystem::path root);

    // Maps a request target to an existing archive beneath the root. Only the
    // last path segment is used; the query string is ignored.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view target) const;

    // Full validating pass over the archive. Throws on any codec error.
    static ArchiveInfo inspect(const std::filesystem::path& archive);

    // inspect() result cached per archive until its size or mtime changes.
    [[nodiscard]] ArchiveInfo info(const std::filesystem::path& archive) const;

private:
    struct CachedInfo {
        uintmax_t size = 0;
        std::filesystem::file_time_type mtime;
        ArchiveInfo info;
    };

    std::filesystem::path root_;

    mutable std::shared_mutex mutex_;
    mutable std::unordered_map<std::string, CachedInfo> cache_;
};

}
