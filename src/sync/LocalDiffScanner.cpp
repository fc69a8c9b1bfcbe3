#include "sync/LocalDiffScanner.hpp"
#include "sync/RegularFileCounter.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>

using namespace ts::sync;
using namespace ts::archive;
using namespace ts::crypto;
using namespace ts::log;

namespace fs = std::filesystem;

LocalDiffScanner::LocalDiffScanner(Options opts) : opts_(std::move(opts)) {
    if (opts_.scratchDir.empty()) throw std::invalid_argument("LocalDiffScanner: scratch directory is required");
    if (!fs::is_directory(opts_.scratchDir)) throw std::invalid_argument("LocalDiffScanner: scratch directory does not exist: " + opts_.scratchDir.string());
}

ScanResult LocalDiffScanner::scan(TarReader& index, TarWriter& partial) const {
    ScanResult result;
    RegularFileCounter counter;
    uint64_t written = 0;

    while (auto entry = index.next()) {
        ++result.entries;

        const auto c = counter.assign(*entry);
        if (!c) {
            partial.writeHeader(*entry);
            partial.copyFrom(index);
            ++written;
            continue;
        }

        if (entry->size != static_cast<int64_t>(CONTENT_HASH_SIZE))
            throw std::runtime_error("malformed index: " + entry->name + " carries " + std::to_string(entry->size) +
                                     " hash bytes, expected " + std::to_string(CONTENT_HASH_SIZE));

        ContentHash expected{};
        index.readExact(reinterpret_cast<char*>(expected.data()), expected.size());

        const auto staged = stage(entry->name, expected);
        if (!staged) {
            if (opts_.debug) Registry::sync()->debug("[LocalDiffScanner] - {}", entry->name);
            result.bitmap.push(true);
            result.missing.push_back({*c, written, entry->name});
            continue;
        }

        if (opts_.debug) Registry::sync()->debug("[LocalDiffScanner] + {}", entry->name);

        Entry local = *entry;
        local.size = static_cast<int64_t>(staged->size);
        partial.writeHeader(local);
        {
            std::ifstream in(staged->path, std::ios::binary);
            if (!in.is_open()) throw std::runtime_error("Failed to reopen scratch copy " + staged->path.string());
            partial.copyFrom(in, staged->size);
        }

        std::error_code ec;
        fs::remove(staged->path, ec);
        if (ec) Registry::sync()->warn("[LocalDiffScanner] Failed to remove {}: {}", staged->path.string(), ec.message());

        result.bitmap.push(false);
        ++result.satisfied;
        result.bytesReused += staged->size;
        ++written;
    }

    partial.close();
    result.regularFiles = counter.assigned();
    return result;
}

std::optional<fs::path> LocalDiffScanner::candidatePath(const std::string& name) const {
    fs::path relative;
    for (const auto& part : fs::path(name).relative_path()) {
        if (part == "..") return std::nullopt;
        if (part.empty() || part == ".") continue;
        relative /= part;
    }
    if (relative.empty()) return std::nullopt;
    return opts_.referenceRoot / relative;
}

std::optional<LocalDiffScanner::Staged> LocalDiffScanner::stage(const std::string& name, const ContentHash& expected) const {
    const auto local = candidatePath(name);
    if (!local) return std::nullopt;

    std::error_code ec;
    if (!fs::is_regular_file(*local, ec)) return std::nullopt;

    Staged staged{opts_.scratchDir / (toHex(expected) + ".tmp"), 0};
    const auto discard = [&] {
        std::error_code ignored;
        fs::remove(staged.path, ignored);
    };

    fs::copy_file(*local, staged.path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        if (opts_.debug) Registry::sync()->debug("[LocalDiffScanner] Cannot copy {}: {}", local->string(), ec.message());
        discard();
        return std::nullopt;
    }

    staged.size = fs::file_size(staged.path, ec);
    if (ec) {
        discard();
        return std::nullopt;
    }

    try {
        if (hashFile(staged.path) != expected) {
            discard();
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        if (opts_.debug) Registry::sync()->debug("[LocalDiffScanner] Cannot hash {}: {}", local->string(), e.what());
        discard();
        return std::nullopt;
    }

    return staged;
}
