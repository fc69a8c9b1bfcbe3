#include "sync/DiffServer.hpp"
#include "sync/PresenceBitmap.hpp"
#include "sync/RegularFileCounter.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::archive;
using namespace ts::log;

DiffStats DiffServer::serve(TarReader& source, const PresenceBitmap& bitmap, TarWriter& diff) const {
    DiffStats stats;
    RegularFileCounter counter;

    while (auto entry = source.next()) {
        ++stats.entries;

        const auto c = counter.assign(*entry);
        if (!c || !bitmap.test(*c)) continue;

        if (opts_.debug) Registry::sync()->debug("[DiffServer] > {}", entry->name);

        diff.writeHeader(*entry);
        stats.bytesSent += diff.copyFrom(source);
        ++stats.sent;
    }

    diff.close();
    stats.regularFiles = counter.assigned();
    return stats;
}
