#pragma once

#include "archive/Gzip.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace ts::client {

class Transport;

enum class Phase { Idle, RequestIndex, ScanLocal, RequestDiff, MergeDiff, Finalize, Done, Failed };

std::string to_string(Phase phase);

struct SyncReport {
    std::filesystem::path output;
    uint64_t entries = 0;
    uint64_t regularFiles = 0;
    uint64_t satisfied = 0;
    uint64_t fetched = 0;
    uint64_t bytesReused = 0;
    bool diffRequested = false;
};

// Runs one sync: fetch the index, scan the reference tree, fetch what is
// missing and write the rebuilt archive to the destination. Any failure
// leaves the client in Phase::Failed and is rethrown; the destination is
// only replaced once the archive is complete.
class SyncClient {
public:
    struct Options {
        std::filesystem::path referenceRoot = "/";
        std::filesystem::path destination;
        std::filesystem::path tempDir;  // empty means the system temp dir
        int bitmapCompressionLevel = 9;
        int outputCompressionLevel = archive::DEFAULT_COMPRESSION_LEVEL;
        bool preserveOrder = true;
        bool debug = false;
    };

    SyncClient(std::shared_ptr<Transport> transport, Options opts);

    SyncReport run();

    [[nodiscard]] Phase phase() const { return phase_; }

private:
    void enter(Phase next);

    std::shared_ptr<Transport> transport_;
    Options opts_;
    Phase phase_ = Phase::Idle;
};

}
