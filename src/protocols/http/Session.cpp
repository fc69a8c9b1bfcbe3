#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "sync/Protocol.hpp"
#include "log/Registry.hpp"

using namespace ts::log;

namespace ts::protocols::http {

namespace bhttp = beast::http;

namespace {
constexpr std::size_t CHUNK_BUFFER_SIZE = 64 * 1024;
}

Session::Session(std::shared_ptr<net::io_context> ioc, tcp::socket socket,
                 std::shared_ptr<Router> router, Options opts)
    : ioc_(std::move(ioc)), stream_(std::move(socket)), router_(std::move(router)), opts_(opts) {
    beast::error_code ec;
    const auto remote = stream_.socket().remote_endpoint(ec);
    peer_ = ec ? "unknown" : endpointToString(remote);
}

template<class Initiate>
beast::error_code Session::complete(Initiate&& initiate) {
    beast::error_code result = net::error::operation_aborted;
    std::forward<Initiate>(initiate)([&result](const beast::error_code& ec, std::size_t) { result = ec; });
    ioc_->restart();
    ioc_->run();
    return result;
}

beast::error_code Session::readRequest(bhttp::request_parser<bhttp::string_body>& parser, const bool idle) {
    stream_.expires_after(idle ? opts_.keepAliveTimeout : opts_.ioTimeout);
    if (const auto ec = complete([&](auto&& handler) {
            bhttp::async_read_header(stream_, buffer_, parser, std::forward<decltype(handler)>(handler));
        })) return ec;
    if (parser.is_done()) return {};

    stream_.expires_after(opts_.ioTimeout);
    return complete([&](auto&& handler) {
        bhttp::async_read(stream_, buffer_, parser, std::forward<decltype(handler)>(handler));
    });
}

void Session::run() {
    for (bool idle = false;; idle = true) {
        bhttp::request_parser<bhttp::string_body> parser;
        parser.body_limit(opts_.maxRequestBytes);

        const auto ec = readRequest(parser, idle);

        if (ec == bhttp::error::end_of_stream) break;
        if (idle && ec == beast::error::timeout) {
            Registry::http()->debug("[Session] {} idle for {}s, closing", peer_, opts_.keepAliveTimeout.count());
            break;
        }
        if (ec == bhttp::error::body_limit) {
            Registry::http()->warn("[Session] {} request body exceeds {} bytes", peer_, opts_.maxRequestBytes);
            version_ = parser.get().version();
            keepAlive_ = false;
            sendText(status::payload_too_large, "413 - request body too large");
            break;
        }
        if (ec) {
            Registry::http()->warn("[Session] {} read error: {}", peer_, ec.message());
            break;
        }

        const auto req = parser.release();
        version_ = req.version();
        keepAlive_ = req.keep_alive() && opts_.keepAliveTimeout.count() > 0;
        started_ = false;

        Registry::http()->info("[Session] {} {} {}", peer_,
                               std::string(req.method_string().data(), req.method_string().size()),
                               std::string(req.target().data(), req.target().size()));

        try {
            router_->route(req, *this);
        } catch (const std::exception& e) {
            Registry::http()->error("[Session] {} aborting response: {}", peer_, e.what());
            abort();
            return;
        }

        if (!keepAlive_) break;
    }

    close();
}

void Session::sendText(const status code, const std::string& body) {
    bhttp::response<bhttp::string_body> res{code, version_};
    res.set(bhttp::field::content_type, "text/plain");
    res.keep_alive(keepAlive_);
    res.body() = body;
    res.prepare_payload();

    started_ = true;
    stream_.expires_after(opts_.ioTimeout);
    throwIf(complete([&](auto&& handler) {
        bhttp::async_write(stream_, res, std::forward<decltype(handler)>(handler));
    }), "write response");
}

std::ostream& Session::beginChunked(const status code, const HeaderList& headers) {
    bhttp::response<bhttp::empty_body> res{code, version_};
    res.set(bhttp::field::content_type, sync::protocol::ARCHIVE_CONTENT_TYPE);
    for (const auto& [name, value] : headers) res.set(name, value);
    res.keep_alive(keepAlive_);
    res.chunked(true);

    started_ = true;
    bhttp::response_serializer<bhttp::empty_body> sr{res};
    stream_.expires_after(opts_.ioTimeout);
    throwIf(complete([&](auto&& handler) {
        bhttp::async_write_header(stream_, sr, std::forward<decltype(handler)>(handler));
    }), "write header");

    body_ = std::make_unique<boost::iostreams::stream<ChunkSink>>(ChunkSink{this}, CHUNK_BUFFER_SIZE);
    body_->exceptions(std::ios::badbit);
    return *body_;
}

void Session::endChunked() {
    if (!body_) throw std::logic_error("endChunked without beginChunked");
    body_->flush();
    body_.reset();

    stream_.expires_after(opts_.ioTimeout);
    throwIf(complete([&](auto&& handler) {
        net::async_write(stream_, bhttp::make_chunk_last(), std::forward<decltype(handler)>(handler));
    }), "write last chunk");
}

void Session::writeChunk(const char* data, const std::size_t size) {
    if (size == 0) return;
    stream_.expires_after(opts_.ioTimeout);
    throwIf(complete([&](auto&& handler) {
        net::async_write(stream_, bhttp::make_chunk(net::const_buffer(data, size)), std::forward<decltype(handler)>(handler));
    }), "write chunk");
}

void Session::throwIf(const beast::error_code& ec, const char* what) const {
    if (ec) throw beast::system_error(ec, std::string(what) + " to " + peer_);
}

void Session::abort() {
    // no terminating chunk: the client must see a broken transfer
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.socket().close(ec);
    if (body_) {
        body_->exceptions(std::ios::goodbit);
        body_.reset();
    }
}

void Session::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
}

}
