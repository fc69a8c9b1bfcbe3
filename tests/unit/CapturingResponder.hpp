#pragma once

#include "client/Transport.hpp"
#include "protocols/http/Responder.hpp"
#include "protocols/http/Router.hpp"
#include "sync/Protocol.hpp"

#include <sstream>
#include <string>

namespace ts::test {

// Records whatever a handler answers, in memory.
class CapturingResponder final : public protocols::http::Responder {
public:
    protocols::http::status code = protocols::http::status::unknown;
    protocols::http::HeaderList headers;
    std::ostringstream body;
    bool chunked = false;
    bool finished = false;

    void sendText(const protocols::http::status c, const std::string& text) override {
        code = c;
        body << text;
        finished = true;
    }

    std::ostream& beginChunked(const protocols::http::status c, const protocols::http::HeaderList& h) override {
        code = c;
        headers = h;
        chunked = true;
        return body;
    }

    void endChunked() override { finished = true; }

    [[nodiscard]] bool started() const override { return chunked; }

    [[nodiscard]] std::string header(const std::string& name) const {
        for (const auto& [k, v] : headers)
            if (k == name) return v;
        return {};
    }
};

// Drives a Router directly, without sockets.
class LoopbackTransport final : public client::Transport {
public:
    LoopbackTransport(std::shared_ptr<protocols::http::Router> router, std::string target)
        : router_(std::move(router)), target_(std::move(target)) {}

    int diffRequests = 0;
    std::string lastBitmap;

    client::IndexResponse fetchIndex(std::ostream& dest) override {
        protocols::http::request req{protocols::http::verb::get, target_, 11};
        CapturingResponder res;
        router_->route(req, res);
        check(res);
        dest << res.body.str();

        client::IndexResponse out;
        out.fingerprint = res.header(sync::protocol::FINGERPRINT_HEADER);
        out.regularFiles = std::stoull(res.header(sync::protocol::REGULAR_FILES_HEADER));
        return out;
    }

    void fetchDiff(const std::string& gzBitmap, const std::string& fingerprint, std::ostream& dest) override {
        ++diffRequests;
        lastBitmap = gzBitmap;
        protocols::http::request req{protocols::http::verb::post, target_, 11};
        if (!fingerprint.empty()) req.set(sync::protocol::FINGERPRINT_HEADER, fingerprint);
        req.body() = gzBitmap;
        req.prepare_payload();
        CapturingResponder res;
        router_->route(req, res);
        check(res);
        dest << res.body.str();
    }

private:
    static void check(const CapturingResponder& res) {
        if (res.code != protocols::http::status::ok)
            throw client::HttpStatusError(static_cast<long>(res.code), res.body.str());
    }

    std::shared_ptr<protocols::http::Router> router_;
    std::string target_;
};

}
