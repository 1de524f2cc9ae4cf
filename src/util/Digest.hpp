#pragma once
#include <cstddef>
#include <string>

struct evp_md_ctx_st;

enum class DigestAlgorithm { Md5, Sha256 };

// Incremental message digest (init / update / final) on top of libcrypto.
class Digest {
public:
    explicit Digest(DigestAlgorithm algorithm);
    ~Digest();
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void update(const char* data, size_t len);
    // Lowercase hex of the digest. The object cannot be updated afterwards.
    std::string hexdigest();

private:
    evp_md_ctx_st* ctx_;
};
