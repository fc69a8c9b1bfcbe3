#include "config/Config.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "util/args.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

using namespace ts::config;
using namespace ts::concurrency;
using namespace ts::protocols;
using namespace ts::util;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

void usage() {
    std::cout << "usage: tarsync-server [options]\n"
                 "  --bind <host:port>   listen address (default 0.0.0.0:8090)\n"
                 "  --root <dir>         directory holding the served archives (default /tmp/)\n"
                 "  --threads <n>        worker threads (default 4)\n"
                 "  --config <file>      YAML configuration file\n"
                 "  --debug              enable debug output\n"
                 "  --help               show this help\n";
}
}

int main(const int argc, char** argv) {
    Config cfg;
    tcp::endpoint endpoint;

    try {
        const auto args = parse_args(normalize_args(argc, argv), {"bind", "root", "threads", "config"}, {"debug", "help"});
        if (args.has("help")) {
            usage();
            return EXIT_SUCCESS;
        }
        if (!args.positional.empty()) throw std::invalid_argument("unexpected argument: " + args.positional.front());

        if (const auto path = args.get("config")) cfg = loadConfig(*path);
        if (const auto root = args.get("root")) cfg.server.archive_root = *root;
        if (const auto threads = args.get("threads")) cfg.server.threads = static_cast<unsigned int>(std::stoul(*threads));
        if (args.has("debug")) applyDebug(cfg);

        endpoint = args.get("bind") ? parseEndpoint(*args.get("bind"), cfg.server.host)
                                    : tcp::endpoint(asio::ip::make_address(cfg.server.host), cfg.server.port);
    } catch (const std::exception& e) {
        std::cerr << "tarsync-server: " << e.what() << "\n";
        usage();
        return 1;
    }

    try {
        ts::log::Registry::init(cfg.logging);
        const auto log = ts::log::Registry::tarsync();

        log->info("[*] Serving archives from {}", cfg.server.archive_root.string());

        auto pool = std::make_shared<ThreadPool>(cfg.server.threads);
        auto router = std::make_shared<http::Router>(http::Router::Options{
            cfg.server.archive_root, cfg.server.compression_level, cfg.server.max_bitmap_bytes, cfg.debug});

        asio::io_context ioc;
        const auto server = std::make_shared<http::Server>(ioc, endpoint, router, pool,
            http::Session::Options{cfg.server.io_timeout, cfg.server.max_request_bytes, cfg.server.keep_alive_timeout});
        server->run();

        std::thread ioThread([&ioc] { ioc.run(); });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        log->info("[!] Shutting down...");

        server->stop();
        ioThread.join();
        pool->stop();

        log->info("[✓] Shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (ts::log::Registry::isInitialized()) ts::log::Registry::tarsync()->error("[-] {}", e.what());
        else std::cerr << "tarsync-server: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
