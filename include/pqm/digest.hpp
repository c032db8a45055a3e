#pragma once

#include <string>

namespace pqm {

// ============================================================================
// SHA-256 Digests (OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase hex
};

// Digest of an in-memory buffer
HashResult compute_sha256(const std::string& data);

// Digest of a file's content, streamed
HashResult compute_file_sha256(const std::string& file_path);

} // namespace pqm
