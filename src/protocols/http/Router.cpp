#include "protocols/http/Router.hpp"
#include "archive/Gzip.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"
#include "sync/DiffServer.hpp"
#include "sync/IndexBuilder.hpp"
#include "sync/PresenceBitmap.hpp"
#include "sync/Protocol.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace ts::archive;
using namespace ts::sync;
using namespace ts::log;

namespace ts::protocols::http {

Router::Router(Options opts) : opts_(std::move(opts)), store_(opts_.archiveRoot) {}

void Router::route(const request& req, Responder& res) const {
    if (req.method() != verb::get && req.method() != verb::post) {
        res.sendText(status::method_not_allowed, "405 - unsupported method");
        return;
    }

    const auto target = req.target();
    const auto archive = store_.resolve(std::string_view(target.data(), target.size()));
    if (!archive) {
        Registry::http()->info("[Router] {} not found beneath {}", std::string(target.data(), target.size()), opts_.archiveRoot.string());
        res.sendText(status::not_found, "404 - File not found!");
        return;
    }

    try {
        if (req.method() == verb::get) handleIndex(*archive, res);
        else handleDiff(req, *archive, res);
    } catch (const std::exception& e) {
        if (res.started()) throw;
        Registry::http()->error("[Router] {} {} failed: {}", std::string(req.method_string().data(), req.method_string().size()), archive->string(), e.what());
        res.sendText(status::internal_server_error, "500 - internal server error");
    }
}

void Router::handleIndex(const std::filesystem::path& archive, Responder& res) const {
    ArchiveInfo info;
    try {
        info = store_.info(archive);
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] Cannot read {}: {}", archive.string(), e.what());
        res.sendText(status::internal_server_error, "500 - cannot read tgz file!");
        return;
    }

    Registry::http()->info("[Router] Serving index of {} ({} entries, {} regular files)",
                           archive.string(), info.entries, info.regularFiles);

    auto& body = res.beginChunked(status::ok, {
        {protocol::FINGERPRINT_HEADER, info.fingerprint},
        {protocol::REGULAR_FILES_HEADER, std::to_string(info.regularFiles)},
    });

    GzipReader source(archive);
    TarReader reader(source.stream());
    GzipWriter gz(body, opts_.compressionLevel);
    TarWriter writer(gz.stream());

    const auto stats = IndexBuilder({opts_.debug}).build(reader, writer);
    gz.finish();
    res.endChunked();

    Registry::http()->debug("[Router] Index of {} sent, {} bytes hashed", archive.string(), stats.bytesHashed);
}

void Router::handleDiff(const request& req, const std::filesystem::path& archive, Responder& res) const {
    ArchiveInfo info;
    try {
        info = store_.info(archive);
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] Cannot read {}: {}", archive.string(), e.what());
        res.sendText(status::internal_server_error, "500 - cannot read tgz file!");
        return;
    }

    if (const auto it = req.find(protocol::FINGERPRINT_HEADER); it != req.end()) {
        if (std::string(it->value().data(), it->value().size()) != info.fingerprint) {
            Registry::http()->warn("[Router] {} changed since its index was served", archive.string());
            res.sendText(status::precondition_failed, "412 - archive changed since the index was served");
            return;
        }
    }

    std::string raw;
    try {
        raw = gzipDecompress(req.body(), opts_.maxBitmapBytes);
    } catch (const std::exception& e) {
        Registry::http()->warn("[Router] Bad bitmap for {}: {}", archive.string(), e.what());
        res.sendText(status::internal_server_error, "500 - Cannot read request bitmap!");
        return;
    }

    if (const auto needed = PresenceBitmap::bytesFor(info.regularFiles); raw.size() < needed) {
        const auto msg = fmt::format("500 - bitmap too short: {} bytes for {} regular files, need {}",
                                     raw.size(), info.regularFiles, needed);
        Registry::http()->error("[Router] {}: {}", archive.string(), msg);
        res.sendText(status::internal_server_error, msg);
        return;
    }

    const auto bitmap = PresenceBitmap::fromBytes(std::move(raw));
    Registry::http()->info("[Router] Serving diff of {} ({} of {} regular files requested)",
                           archive.string(), bitmap.countSet(), info.regularFiles);

    auto& body = res.beginChunked(status::ok, {{protocol::FINGERPRINT_HEADER, info.fingerprint}});

    GzipReader source(archive);
    TarReader reader(source.stream());
    GzipWriter gz(body, opts_.compressionLevel);
    TarWriter writer(gz.stream());

    const auto stats = DiffServer({opts_.debug}).serve(reader, bitmap, writer);
    gz.finish();
    res.endChunked();

    Registry::http()->debug("[Router] Diff of {} sent, {} entries, {} bytes", archive.string(), stats.sent, stats.bytesSent);
}

}
