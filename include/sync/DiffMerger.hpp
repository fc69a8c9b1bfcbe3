#pragma once

#include "sync/LocalDiffScanner.hpp"

#include <cstdint>
#include <vector>

namespace ts::archive {
class TarReader;
class TarWriter;
}

namespace ts::sync {

struct MergeStats {
    uint64_t entries = 0;
    uint64_t fetched = 0;
};

// Combines the partial archive left by the scanner with the diff response.
// With preserveOrder each fetched entry goes back to its recorded position;
// otherwise fetched entries are appended after every local one.
class DiffMerger {
public:
    struct Options {
        bool preserveOrder = true;
        bool debug = false;
    };

    explicit DiffMerger(Options opts) : opts_(opts) {}

    // diff may be null only when nothing is missing. Closes the output archive.
    MergeStats merge(archive::TarReader& partial, archive::TarReader* diff,
                     const std::vector<MissingEntry>& missing, archive::TarWriter& out) const;

private:
    void takeFetched(archive::TarReader& diff, const MissingEntry& expected, archive::TarWriter& out) const;

    Options opts_;
};

}
