#pragma once

#include "checksum.hpp"
#include <string>
#include <string_view>
#include <filesystem>
#include <expected>

namespace chkr {

// MD5, the algorithm md5sum manifests are written with.
constexpr size_t kDigestHexLength = 32;

// Lowercase hex digest of an in-memory buffer. Fails only if OpenSSL does.
std::expected<std::string, std::string> compute_digest(std::string_view bytes);

// Digest of a whole file, read in read_buffer_size chunks.
std::expected<std::string, VerifyErrorInfo> compute_file_digest(
    const std::filesystem::path& path,
    const VerifyConfig& config = {}
);

// Case-sensitive comparison against expected_digest.
VerifyResult verify_checksum(
    const std::filesystem::path& path,
    std::string_view expected_digest,
    const VerifyConfig& config = {}
);

} // namespace chkr
