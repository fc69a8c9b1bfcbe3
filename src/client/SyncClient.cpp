#include "client/SyncClient.hpp"
#include "client/Transport.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"
#include "sync/DiffMerger.hpp"
#include "sync/LocalDiffScanner.hpp"
#include "util/ScratchDir.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>

using namespace ts::client;
using namespace ts::archive;
using namespace ts::sync;
using namespace ts::util;
using namespace ts::log;

namespace fs = std::filesystem;

namespace {

std::ofstream createFile(const fs::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to create " + path.string());
    return out;
}

void closeFile(std::ofstream& out, const fs::path& path) {
    out.close();
    if (out.fail()) throw std::runtime_error("Failed to write " + path.string());
}

}

std::string ts::client::to_string(const Phase phase) {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::RequestIndex: return "request-index";
        case Phase::ScanLocal: return "scan-local";
        case Phase::RequestDiff: return "request-diff";
        case Phase::MergeDiff: return "merge-diff";
        case Phase::Finalize: return "finalize";
        case Phase::Done: return "done";
        case Phase::Failed: return "failed";
    }
    return "unknown";
}

SyncClient::SyncClient(std::shared_ptr<Transport> transport, Options opts)
    : transport_(std::move(transport)), opts_(std::move(opts)) {
    if (!transport_) throw std::invalid_argument("SyncClient requires a transport");
    if (opts_.destination.empty()) throw std::invalid_argument("SyncClient requires a destination");
}

void SyncClient::enter(const Phase next) {
    if (opts_.debug) Registry::client()->debug("[SyncClient] {} -> {}", to_string(phase_), to_string(next));
    phase_ = next;
}

SyncReport SyncClient::run() {
    SyncReport report;
    report.output = opts_.destination;

    try {
        const ScratchDir scratch(opts_.tempDir);

        enter(Phase::RequestIndex);
        const auto indexPath = scratch.path() / "index.tgz";
        IndexResponse index;
        {
            auto out = createFile(indexPath);
            index = transport_->fetchIndex(out);
            closeFile(out, indexPath);
        }

        enter(Phase::ScanLocal);
        const auto partialPath = scratch.path() / "partial.tar";
        ScanResult scan;
        {
            GzipReader in(indexPath);
            TarReader reader(in.stream());
            auto out = createFile(partialPath);
            TarWriter writer(out);
            scan = LocalDiffScanner({opts_.referenceRoot, scratch.path(), opts_.debug}).scan(reader, writer);
            closeFile(out, partialPath);
        }

        if (index.regularFiles && *index.regularFiles != scan.regularFiles)
            throw std::runtime_error("index announced " + std::to_string(*index.regularFiles) +
                                     " regular files but carries " + std::to_string(scan.regularFiles));

        report.entries = scan.entries;
        report.regularFiles = scan.regularFiles;
        report.satisfied = scan.satisfied;
        report.bytesReused = scan.bytesReused;

        Registry::client()->info("[SyncClient] {} of {} regular files found locally, {} to download",
                                 scan.satisfied, scan.regularFiles, scan.missing.size());

        std::optional<fs::path> diffPath;
        if (scan.bitmap.any()) {
            enter(Phase::RequestDiff);
            diffPath = scratch.path() / "diff.tgz";
            const auto body = gzipCompress(scan.bitmap.pack(), opts_.bitmapCompressionLevel);
            auto out = createFile(*diffPath);
            transport_->fetchDiff(body, index.fingerprint, out);
            closeFile(out, *diffPath);
            report.diffRequested = true;
        }

        enter(Phase::MergeDiff);
        auto partPath = opts_.destination;
        partPath += ".part";
        {
            std::ifstream partialIn(partialPath, std::ios::binary);
            if (!partialIn.is_open()) throw std::runtime_error("Failed to reopen " + partialPath.string());
            TarReader partial(partialIn);

            std::unique_ptr<GzipReader> diffIn;
            std::unique_ptr<TarReader> diff;
            if (diffPath) {
                diffIn = std::make_unique<GzipReader>(*diffPath);
                diff = std::make_unique<TarReader>(diffIn->stream());
            }

            GzipWriter gz(partPath, opts_.outputCompressionLevel);
            TarWriter writer(gz.stream());
            const auto merged = DiffMerger({opts_.preserveOrder, opts_.debug}).merge(partial, diff.get(), scan.missing, writer);
            report.fetched = merged.fetched;

            enter(Phase::Finalize);
            gz.finish();
        }

        fs::rename(partPath, opts_.destination);
        enter(Phase::Done);
    } catch (const std::exception& e) {
        Registry::client()->error("[SyncClient] Sync failed during {}: {}", to_string(phase_), e.what());
        phase_ = Phase::Failed;
        throw;
    }

    Registry::client()->info("[SyncClient] Wrote {} ({} entries, {} fetched)", report.output.string(), report.entries, report.fetched);
    return report;
}
