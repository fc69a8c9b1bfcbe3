#pragma once

#include "crypto/ContentHash.hpp"
#include "sync/PresenceBitmap.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ts::archive {
class TarReader;
class TarWriter;
}

namespace ts::sync {

// A regular file the client could not satisfy locally.
struct MissingEntry {
    uint64_t counter = 0;
    uint64_t position = 0;  // entries written to the partial archive before it
    std::string name;
};

struct ScanResult {
    PresenceBitmap bitmap;
    std::vector<MissingEntry> missing;
    uint64_t entries = 0;
    uint64_t regularFiles = 0;
    uint64_t satisfied = 0;
    uint64_t bytesReused = 0;
};

// Walks an index against a local reference tree. Satisfied files are written
// to the partial archive with their local content; missing ones only set their
// bit. Local lookup failures never escape: they mark the file missing.
class LocalDiffScanner {
public:
    struct Options {
        std::filesystem::path referenceRoot = "/";
        std::filesystem::path scratchDir;
        bool debug = false;
    };

    explicit LocalDiffScanner(Options opts);

    // Closes the partial archive.
    ScanResult scan(archive::TarReader& index, archive::TarWriter& partial) const;

    // Path beneath the reference root for an archive member name, or nothing
    // when the name is empty or climbs out with "..".
    [[nodiscard]] std::optional<std::filesystem::path> candidatePath(const std::string& name) const;

private:
    struct Staged {
        std::filesystem::path path;
        uintmax_t size = 0;
    };

    std::optional<Staged> stage(const std::string& name, const crypto::ContentHash& expected) const;

    Options opts_;
};

}
