#include "Digest.hpp"

#include <openssl/evp.h>
#include <stdexcept>

Digest::Digest(DigestAlgorithm algorithm) : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("digest: out of memory");
    const EVP_MD* md = algorithm == DigestAlgorithm::Md5 ? EVP_md5() : EVP_sha256();
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("digest: initialization failed");
    }
}

Digest::~Digest() {
    EVP_MD_CTX_free(ctx_);
}

void Digest::update(const char* data, size_t len) {
    if (EVP_DigestUpdate(ctx_, data, len) != 1) throw std::runtime_error("digest: update failed");
}

std::string Digest::hexdigest() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, md, &len) != 1) throw std::runtime_error("digest: finalization failed");
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[md[i] >> 4]);
        out.push_back(hex[md[i] & 0x0f]);
    }
    return out;
}
