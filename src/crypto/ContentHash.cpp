#include "crypto/ContentHash.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

using namespace ts::crypto;

namespace {
constexpr std::size_t READ_CHUNK = 64 * 1024;
}

void Sha1Hasher::CtxDeleter::operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }

Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    reset();
}

void Sha1Hasher::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex(sha1) failed");
}

void Sha1Hasher::update(const void* data, const std::size_t size) {
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
}

ContentHash Sha1Hasher::finish() {
    ContentHash out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != CONTENT_HASH_SIZE)
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    reset();
    return out;
}

ContentHash ts::crypto::hashStream(std::istream& in) {
    Sha1Hasher hasher;
    std::vector<char> buffer(READ_CHUNK);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in.bad()) throw std::runtime_error("read failed while hashing");
        hasher.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    return hasher.finish();
}

ContentHash ts::crypto::hashFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("Failed to open file for hashing: " + path.string());
    return hashStream(in);
}

ContentHash ts::crypto::hashBytes(const std::string_view data) {
    Sha1Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

std::string ts::crypto::toHex(const ContentHash& hash) {
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}
