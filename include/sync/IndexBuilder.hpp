#pragma once

#include <cstdint>

namespace ts::archive {
class TarReader;
class TarWriter;
}

namespace ts::sync {

struct IndexStats {
    uint64_t entries = 0;
    uint64_t regularFiles = 0;
    uint64_t bytesHashed = 0;
};

// Rewrites an archive into its index form: every counted regular file keeps
// its header but carries its 20-byte content hash as payload. Everything else
// passes through untouched. Closes the output archive.
class IndexBuilder {
public:
    struct Options {
        bool debug = false;
    };

    explicit IndexBuilder(Options opts) : opts_(opts) {}

    IndexStats build(archive::TarReader& source, archive::TarWriter& index) const;

private:
    Options opts_;
};

}
