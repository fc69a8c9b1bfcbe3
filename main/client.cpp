#include "client/CurlTransport.hpp"
#include "client/Destination.hpp"
#include "client/SyncClient.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "util/args.hpp"

#include <iostream>

using namespace ts::client;
using namespace ts::config;
using namespace ts::util;

namespace {
void usage() {
    std::cout << "usage: tarsync-client --src <url> [options]\n"
                 "  --src <url>       archive URL, must end in the archive suffix (.tgz)\n"
                 "  --dst <path>      destination file or directory (default ./)\n"
                 "  --ref <dir>       local reference directory (default /)\n"
                 "  --config <file>   YAML configuration file\n"
                 "  --debug           enable debug output\n"
                 "  --help            show this help\n";
}
}

int main(const int argc, char** argv) {
    Config cfg;
    std::string src;
    std::filesystem::path dst;
    std::filesystem::path ref = "/";

    try {
        const auto args = parse_args(normalize_args(argc, argv), {"src", "dst", "ref", "config"}, {"debug", "help"});
        if (args.has("help")) {
            usage();
            return EXIT_SUCCESS;
        }
        if (!args.positional.empty()) throw std::invalid_argument("unexpected argument: " + args.positional.front());

        if (const auto path = args.get("config")) cfg = loadConfig(*path);
        if (args.has("debug")) applyDebug(cfg);

        const auto srcArg = args.get("src");
        if (!srcArg) throw std::invalid_argument("--src is required");
        src = *srcArg;
        dst = resolveDestination(src, args.get("dst").value_or("./"), cfg.client.archive_suffix);
        if (const auto r = args.get("ref")) ref = *r;
    } catch (const std::exception& e) {
        std::cerr << "tarsync-client: " << e.what() << "\n";
        usage();
        return 1;
    }

    try {
        ts::log::Registry::init(cfg.logging);
        const auto log = ts::log::Registry::client();

        log->debug("src: {}", src);
        log->debug("dst: {}", dst.string());
        log->debug("ref: {}", ref.string());
        log->info("Syncing {} to {}", src, dst.string());

        auto transport = std::make_shared<CurlTransport>(src, CurlTransport::Options{cfg.client.io_timeout, cfg.debug});

        SyncClient client(transport, SyncClient::Options{
            .referenceRoot = ref,
            .destination = dst,
            .tempDir = cfg.client.temp_dir,
            .bitmapCompressionLevel = cfg.client.bitmap_compression_level,
            .preserveOrder = cfg.client.preserve_order,
            .debug = cfg.debug,
        });

        const auto report = client.run();
        log->info("Done: {} entries, {} reused locally ({} bytes), {} downloaded",
                  report.entries, report.satisfied, report.bytesReused, report.fetched);
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (ts::log::Registry::isInitialized()) ts::log::Registry::client()->error("[-] {}", e.what());
        else std::cerr << "tarsync-client: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
