#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ts::crypto {

constexpr std::size_t CONTENT_HASH_SIZE = 20;
using ContentHash = std::array<uint8_t, CONTENT_HASH_SIZE>;

// Incremental SHA-1. Used as a file identity fingerprint only.
class Sha1Hasher {
public:
    Sha1Hasher();

    void update(const void* data, std::size_t size);

    // Finalizes the digest. The hasher is reset afterwards.
    ContentHash finish();

private:
    struct CtxDeleter { void operator()(EVP_MD_CTX* ctx) const; };

    void reset();

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

ContentHash hashStream(std::istream& in);
ContentHash hashFile(const std::filesystem::path& path);
ContentHash hashBytes(std::string_view data);

std::string toHex(const ContentHash& hash);

}
