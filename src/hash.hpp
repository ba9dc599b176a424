#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// Incremental SHA-1. Throws MandumpException if OpenSSL fails.
class Sha1Hasher {
public:
    Sha1Hasher();
    void update(std::string_view data);
    void update_int64_le(std::int64_t value);
    // Returns the raw digest. The hasher cannot be updated afterwards.
    std::string finish();
private:
    EvpMdCtxPtr ctx_;
};

std::string sha1_digest(std::string_view data);
std::string hmac_sha1(std::string_view key, std::string_view data);

// Formats a raw digest as a weak entity tag: W/"<unpadded base64url>".
std::string make_etag(std::string_view digest);
