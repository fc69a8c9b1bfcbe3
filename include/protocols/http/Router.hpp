#pragma once

#include "archive/ArchiveStore.hpp"
#include "protocols/http/Responder.hpp"

#include <boost/beast/http.hpp>

#include <cstdint>
#include <filesystem>

namespace ts::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using verb = boost::beast::http::verb;

// GET serves the index of an archive, POST the entries a bitmap asks for.
class Router {
public:
    struct Options {
        std::filesystem::path archiveRoot;
        int compressionLevel = 6;
        uintmax_t maxBitmapBytes = 16 * 1024 * 1024;
        bool debug = false;
    };

    explicit Router(Options opts);

    // Errors raised before the response started are answered with a 500;
    // later ones propagate so the connection can be torn down.
    void route(const request& req, Responder& res) const;

private:
    void handleIndex(const std::filesystem::path& archive, Responder& res) const;
    void handleDiff(const request& req, const std::filesystem::path& archive, Responder& res) const;

    Options opts_;
    archive::ArchiveStore store_;
};

}
