#include "toolshed/integrity.hpp"

#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace toolshed {

namespace {

// Incremental SHA-256 over OpenSSL EVP. The first failing call latches an
// error; later calls are no-ops.
class Sha256Stream {
public:
    Sha256Stream() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_) {
            error_ = "EVP_MD_CTX_new failed";
        } else if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            error_ = "EVP_DigestInit_ex failed";
        }
    }

    void update(const void* data, size_t len) {
        if (!error_.empty() || len == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            error_ = "EVP_DigestUpdate failed";
        }
    }

    HashResult finish() {
        HashResult result;
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) != 1) {
            result.error = "EVP_DigestFinal_ex failed";
            return result;
        }

        static const char hex[] = "0123456789abcdef";
        result.hex_digest.reserve(digest_len * 2);
        for (unsigned int i = 0; i < digest_len; ++i) {
            result.hex_digest += hex[digest[i] >> 4];
            result.hex_digest += hex[digest[i] & 0x0F];
        }
        result.ok = true;
        return result;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    std::string error_;
};

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    Sha256Stream sha;
    sha.update(data.data(), data.size());
    return sha.finish();
}

HashResult compute_sha256_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        HashResult result;
        result.error = "cannot open " + file_path + " for hashing";
        return result;
    }

    Sha256Stream sha;
    std::vector<char> chunk(1 << 16);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        sha.update(chunk.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        HashResult result;
        result.error = "read error while hashing " + file_path;
        return result;
    }
    return sha.finish();
}

bool is_valid_sha256(const std::string& digest) {
    return digest.size() == 64 &&
           digest.find_first_not_of("0123456789abcdef") == std::string::npos;
}

Sha256VerifyResult verify_file_sha256(const std::string& file_path,
                                      const std::string& expected_hex) {
    Sha256VerifyResult result;
    result.expected_digest = expected_hex;

    // Uppercase or short digests are rejected, not normalized
    if (!is_valid_sha256(expected_hex)) {
        result.error = "malformed SHA-256 digest '" + expected_hex +
                       "': expected 64 lowercase hex characters";
        return result;
    }

    HashResult hashed = compute_sha256_file(file_path);
    if (!hashed.ok) {
        result.error = hashed.error;
        return result;
    }
    result.actual_digest = hashed.hex_digest;

    if (result.actual_digest != expected_hex) {
        result.error = "SHA-256 mismatch for " + file_path + ": expected " + expected_hex +
                       ", got " + result.actual_digest;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace toolshed
