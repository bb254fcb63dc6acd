#include "venues/rest/signing.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace {
    unsigned int hmac_sha256(const std::string& key, const std::string& message,
        unsigned char* digest)
    {
        unsigned int digest_len = 0;
        const unsigned char* out = HMAC(EVP_sha256(),
            key.data(),
            static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(message.data()),
            message.size(),
            digest,
            &digest_len);
        if (out == nullptr) {
            throw std::runtime_error("HMAC-SHA256 failed");
        }
        return digest_len;
    }
}

std::string base64_encode(const unsigned char* data, std::size_t len) {
    BIO* bio, * b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(bio, data, static_cast<int>(len));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    static const char kHex[] = "0123456789abcdef";
    unsigned char digest[EVP_MAX_MD_SIZE];
    const unsigned int n = hmac_sha256(key, message, digest);

    std::string out;
    out.reserve(n * 2);
    for (unsigned int i = 0; i < n; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

std::string hmac_sha256_base64(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    const unsigned int n = hmac_sha256(key, message, digest);
    return base64_encode(digest, n);
}
