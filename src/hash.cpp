#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/hmac.h>

#include <cstdint>
#include <vector>

Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw MandumpException(get_string("error.openssl_ctx_failed"));
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
        throw MandumpException(get_string("error.openssl_init_failed"));
    }
}

void Sha1Hasher::update(std::string_view data) {
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw MandumpException(get_string("error.openssl_update_failed"));
    }
}

void Sha1Hasher::update_int64_le(std::int64_t value) {
    auto u = static_cast<std::uint64_t>(value);
    char buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<char>((u >> (8 * i)) & 0xff);
    }
    update(std::string_view(buf, sizeof(buf)));
}

std::string Sha1Hasher::finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
        throw MandumpException(get_string("error.openssl_final_failed"));
    }
    return std::string(reinterpret_cast<const char*>(hash), hash_len);
}

std::string sha1_digest(std::string_view data) {
    Sha1Hasher h;
    h.update(data);
    return h.finish();
}

std::string hmac_sha1(std::string_view key, std::string_view data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &out_len) == nullptr) {
        throw MandumpException(get_string("error.openssl_hmac_failed"));
    }
    return std::string(reinterpret_cast<const char*>(out), out_len);
}

std::string make_etag(std::string_view digest) {
    std::vector<unsigned char> encoded(4 * ((digest.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(encoded.data(), reinterpret_cast<const unsigned char*>(digest.data()),
                            static_cast<int>(digest.size()));

    std::string text(reinterpret_cast<const char*>(encoded.data()), n);
    while (!text.empty() && text.back() == '=') text.pop_back();
    for (auto& c : text) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return "W/\"" + text + "\"";
}
