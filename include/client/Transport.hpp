#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ts::client {

struct IndexResponse {
    std::string fingerprint;
    std::optional<uint64_t> regularFiles;
};

// Raised for any non-2xx answer; carries the server's diagnostic text.
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(const long status, const std::string& what) : std::runtime_error(what), status_(status) {}
    [[nodiscard]] long status() const { return status_; }

private:
    long status_;
};

// The two requests of a sync, against one archive URL. Bodies are streamed
// into dest as received (still gzip'd).
class Transport {
public:
    virtual ~Transport() = default;

    virtual IndexResponse fetchIndex(std::ostream& dest) = 0;

    // fingerprint may be empty, in which case the server does not check it.
    virtual void fetchDiff(const std::string& gzBitmap, const std::string& fingerprint, std::ostream& dest) = 0;
};

}
