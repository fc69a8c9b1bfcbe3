#pragma once

#include "protocols/http/Responder.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ts::protocols::http {

class Router;

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One client connection. The session owns its io_context and is driven to
// completion on a single worker thread; every socket operation is bounded by
// the configured I/O timeout. Waiting for a follow-up request on a kept-alive
// connection is bounded by keepAliveTimeout instead.
class Session final : public Responder {
public:
    struct Options {
        std::chrono::seconds ioTimeout = std::chrono::seconds(600);
        uintmax_t maxRequestBytes = 1024 * 1024;
        std::chrono::seconds keepAliveTimeout = std::chrono::seconds(5);  // 0 disables keep-alive
    };

    Session(std::shared_ptr<net::io_context> ioc, tcp::socket socket,
            std::shared_ptr<Router> router, Options opts);

    void run();

    void sendText(status code, const std::string& body) override;
    std::ostream& beginChunked(status code, const HeaderList& headers) override;
    void endChunked() override;
    [[nodiscard]] bool started() const override { return started_; }

private:
    // Sink device turning each flushed buffer into one HTTP chunk.
    struct ChunkSink {
        typedef char char_type;
        typedef boost::iostreams::sink_tag category;

        Session* session;

        std::streamsize write(const char* s, std::streamsize n) {
            session->writeChunk(s, static_cast<std::size_t>(n));
            return n;
        }
    };

    template<class Initiate>
    beast::error_code complete(Initiate&& initiate);

    beast::error_code readRequest(beast::http::request_parser<beast::http::string_body>& parser, bool idle);

    void writeChunk(const char* data, std::size_t size);
    void throwIf(const beast::error_code& ec, const char* what) const;
    void abort();
    void close();

    std::shared_ptr<net::io_context> ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<Router> router_;
    Options opts_;

    std::unique_ptr<boost::iostreams::stream<ChunkSink>> body_;
    std::string peer_;
    unsigned version_ = 11;
    bool keepAlive_ = false;
    bool started_ = false;
};

}
