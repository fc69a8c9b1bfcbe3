#pragma once

#include "client/Transport.hpp"

#include <chrono>
#include <string>

namespace ts::client {

class CurlTransport final : public Transport {
public:
    struct Options {
        std::chrono::seconds ioTimeout = std::chrono::seconds(600);
        bool debug = false;
    };

    CurlTransport(std::string url, Options opts);

    IndexResponse fetchIndex(std::ostream& dest) override;
    void fetchDiff(const std::string& gzBitmap, const std::string& fingerprint, std::ostream& dest) override;

private:
    std::string url_;
    Options opts_;
};

}
