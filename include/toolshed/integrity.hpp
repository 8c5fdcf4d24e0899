#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace toolshed {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);

// Streams the file in fixed-size chunks
HashResult compute_sha256_file(const std::string& file_path);

// True for exactly 64 lowercase hex characters
bool is_valid_sha256(const std::string& digest);

struct Sha256VerifyResult {
    bool ok = false;
    std::string error;
    std::string actual_digest;
    std::string expected_digest;
};

// Compare a file's digest against an expected one. A malformed expected
// digest fails without hashing; comparison is exact.
Sha256VerifyResult verify_file_sha256(const std::string& file_path,
                                      const std::string& expected_hex);

} // namespace toolshed
