#include "client/CurlTransport.hpp"
#include "sync/Protocol.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <map>

using namespace ts::client;
using namespace ts::util;
using namespace ts::log;

// --- helpers --------------------------------------------------------------
namespace {

constexpr std::size_t MAX_ERROR_BODY = 4096;

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/** One transfer: the body goes to dest on 2xx, into errorBody otherwise */
struct Download {
    CURL* handle = nullptr;
    std::ostream* dest = nullptr;
    std::string errorBody;
    std::map<std::string, std::string> headers;  // lower-cased names, final response only
    bool sinkFailed = false;
};

size_t onBody(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* d = static_cast<Download*>(userdata);
    const auto len = size * nmemb;

    long status = 0;
    curl_easy_getinfo(d->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) {
        if (d->errorBody.size() < MAX_ERROR_BODY) d->errorBody.append(ptr, std::min(len, MAX_ERROR_BODY - d->errorBody.size()));
        return len;
    }

    d->dest->write(ptr, static_cast<std::streamsize>(len));
    if (!*d->dest) {
        d->sinkFailed = true;
        return 0;
    }
    return len;
}

size_t onHeader(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* d = static_cast<Download*>(userdata);
    const std::string line(ptr, size * nmemb);

    if (line.starts_with("HTTP/")) d->headers.clear();  // redirects start a new header block
    else if (const auto colon = line.find(':'); colon != std::string::npos)
        d->headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));

    return size * nmemb;
}

void perform(CurlEasy& h, Download& d, const std::string& url, const std::chrono::seconds timeout) {
    d.handle = h;

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &d);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &d);

    const CURLcode res = curl_easy_perform(h);
    if (d.sinkFailed) throw std::runtime_error("Failed to store response body of " + url);
    if (res != CURLE_OK) throw std::runtime_error(fmt::format("curl: {} ({})", curl_easy_strerror(res), url));

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) throw HttpStatusError(status, fmt::format("HTTP {} from {}: {}", status, url, trim(d.errorBody)));
}

} // namespace

CurlTransport::CurlTransport(std::string url, Options opts) : url_(std::move(url)), opts_(opts) {
    if (url_.empty()) throw std::invalid_argument("CurlTransport requires a URL");
    ensureCurlGlobalInit();
}

IndexResponse CurlTransport::fetchIndex(std::ostream& dest) {
    CurlEasy h;
    Download d;
    d.dest = &dest;

    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    perform(h, d, url_, opts_.ioTimeout);

    IndexResponse res;
    if (const auto it = d.headers.find(lower(sync::protocol::FINGERPRINT_HEADER)); it != d.headers.end())
        res.fingerprint = it->second;

    if (const auto it = d.headers.find(lower(sync::protocol::REGULAR_FILES_HEADER)); it != d.headers.end()) {
        const auto& value = it->second;
        if (value.empty() || !std::ranges::all_of(value, [](const unsigned char c) { return std::isdigit(c) != 0; }))
            throw std::runtime_error("malformed " + std::string(sync::protocol::REGULAR_FILES_HEADER) + " header: " + value);
        res.regularFiles = std::stoull(value);
    }

    if (opts_.debug)
        Registry::client()->debug("[CurlTransport] Index of {}: fingerprint '{}', {} regular files announced", url_,
                                  res.fingerprint, res.regularFiles ? std::to_string(*res.regularFiles) : "no");
    return res;
}

void CurlTransport::fetchDiff(const std::string& gzBitmap, const std::string& fingerprint, std::ostream& dest) {
    CurlEasy h;
    Download d;
    d.dest = &dest;

    SList headers;
    headers.add(std::string("Content-Type: ") + sync::protocol::ARCHIVE_CONTENT_TYPE);
    headers.add("Expect:");
    if (!fingerprint.empty()) headers.add(std::string(sync::protocol::FINGERPRINT_HEADER) + ": " + fingerprint);

    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, gzBitmap.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(gzBitmap.size()));

    perform(h, d, url_, opts_.ioTimeout);
}
