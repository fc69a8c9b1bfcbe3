#pragma once

#include <cstdint>

namespace ts::archive {
class TarReader;
class TarWriter;
}

namespace ts::sync {

class PresenceBitmap;

struct DiffStats {
    uint64_t entries = 0;
    uint64_t regularFiles = 0;
    uint64_t sent = 0;
    uint64_t bytesSent = 0;
};

// Re-walks the source archive and streams every counted regular file whose
// bit is set. Nothing else is ever emitted. A bitmap too short for the archive
// raises std::out_of_range. Closes the output archive.
class DiffServer {
public:
    struct Options {
        bool debug = false;
    };

    explicit DiffServer(Options opts) : opts_(opts) {}

    DiffStats serve(archive::TarReader& source, const PresenceBitmap& bitmap, archive::TarWriter& diff) const;

private:
    Options opts_;
};

}
