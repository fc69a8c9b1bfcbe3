#pragma once

#include <boost/beast/http/status.hpp>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ts::protocols::http {

using status = boost::beast::http::status;
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// What a handler may do with the connection it is answering.
class Responder {
public:
    virtual ~Responder() = default;

    virtual void sendText(status code, const std::string& body) = 0;

    // Sends the status line and headers of a chunked response. Bytes written to
    // the returned stream go out as chunks.
    virtual std::ostream& beginChunked(status code, const HeaderList& headers) = 0;

    // Flushes the body and writes the terminating chunk.
    virtual void endChunked() = 0;

    [[nodiscard]] virtual bool started() const = 0;
};

}
