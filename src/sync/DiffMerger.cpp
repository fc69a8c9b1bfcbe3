#include "sync/DiffMerger.hpp"
#include "sync/RegularFileCounter.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ts::sync;
using namespace ts::archive;
using namespace ts::log;

MergeStats DiffMerger::merge(TarReader& partial, TarReader* diff,
                             const std::vector<MissingEntry>& missing, TarWriter& out) const {
    if (!missing.empty() && !diff) throw std::invalid_argument("DiffMerger: missing entries but no diff response");

    MergeStats stats;
    std::size_t next = 0;
    uint64_t position = 0;

    const auto spliceAt = [&](const uint64_t pos) {
        while (next < missing.size() && missing[next].position == pos) {
            takeFetched(*diff, missing[next++], out);
            ++stats.fetched;
            ++stats.entries;
        }
    };

    while (auto entry = partial.next()) {
        if (opts_.preserveOrder) spliceAt(position);
        out.writeHeader(*entry);
        out.copyFrom(partial);
        ++position;
        ++stats.entries;
    }

    if (opts_.preserveOrder) spliceAt(position);
    else {
        while (next < missing.size()) {
            takeFetched(*diff, missing[next++], out);
            ++stats.fetched;
            ++stats.entries;
        }
    }

    if (next != missing.size())
        throw std::runtime_error("DiffMerger: " + missing[next].name + " recorded at position " +
                                 std::to_string(missing[next].position) + " beyond the partial archive");

    if (diff) {
        if (const auto extra = diff->next())
            throw std::runtime_error("malformed diff response: unrequested entry " + extra->name);
    }

    out.close();
    return stats;
}

void DiffMerger::takeFetched(TarReader& diff, const MissingEntry& expected, TarWriter& out) const {
    const auto fetched = diff.next();
    if (!fetched) throw std::runtime_error("malformed diff response: ends before " + expected.name);
    if (fetched->name != expected.name)
        throw std::runtime_error("malformed diff response: expected " + expected.name + ", got " + fetched->name);
    if (!RegularFileCounter::isCounted(*fetched))
        throw std::runtime_error("malformed diff response: " + fetched->name + " is not a non-empty regular file");

    if (opts_.debug) Registry::sync()->debug("[DiffMerger] < {}", fetched->name);

    out.writeHeader(*fetched);
    out.copyFrom(diff);
}
