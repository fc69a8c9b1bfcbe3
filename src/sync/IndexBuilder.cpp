#include "sync/IndexBuilder.hpp"
#include "sync/RegularFileCounter.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"
#include "crypto/ContentHash.hpp"
#include "log/Registry.hpp"

#include <vector>

using namespace ts::sync;
using namespace ts::archive;
using namespace ts::crypto;
using namespace ts::log;

namespace {
constexpr std::size_t HASH_CHUNK = 64 * 1024;
}

IndexStats IndexBuilder::build(TarReader& source, TarWriter& index) const {
    IndexStats stats;
    RegularFileCounter counter;
    std::vector<char> buffer(HASH_CHUNK);

    while (auto entry = source.next()) {
        ++stats.entries;

        if (!counter.assign(*entry)) {
            index.writeHeader(*entry);
            index.copyFrom(source);
            continue;
        }

        Sha1Hasher hasher;
        while (const auto n = source.read(buffer.data(), buffer.size())) {
            hasher.update(buffer.data(), n);
            stats.bytesHashed += n;
        }
        const auto hash = hasher.finish();

        if (opts_.debug) Registry::sync()->debug("[IndexBuilder] {} : {}", toHex(hash), entry->name);

        Entry hashed = *entry;
        hashed.size = static_cast<int64_t>(CONTENT_HASH_SIZE);
        index.writeHeader(hashed);
        index.write(reinterpret_cast<const char*>(hash.data()), hash.size());
    }

    index.close();
    stats.regularFiles = counter.assigned();
    return stats;
}
