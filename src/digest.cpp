#include "digest.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <algorithm>
#include <vector>
#include <system_error>
#include <openssl/evp.h>

namespace chkr {

namespace {

constexpr size_t kMinReadBuffer = 4096;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

MdCtxPtr new_md5_context() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::expected<std::string, std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        return std::unexpected("EVP_DigestFinal_ex failed");
    }
    return to_hex(hash, hash_len);
}

} // namespace

std::expected<std::string, std::string> compute_digest(std::string_view bytes) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), hash, &hash_len, EVP_md5(), nullptr) != 1) {
        return std::unexpected("EVP_Digest failed");
    }
    return to_hex(hash, hash_len);
}

std::expected<std::string, VerifyErrorInfo> compute_file_digest(
    const std::filesystem::path& path,
    const VerifyConfig& config
) {
    std::error_code ec;
    auto st = std::filesystem::status(path, ec);
    if (st.type() == std::filesystem::file_type::not_found) {
        return std::unexpected(VerifyErrorInfo{VerifyError::NotFound, "No such file or directory", path});
    }
    // EACCES, ELOOP, ENAMETOOLONG and friends
    if (ec) {
        return std::unexpected(VerifyErrorInfo{VerifyError::OpenFailed, ec.message(), path});
    }
    if (std::filesystem::is_directory(st)) {
        return std::unexpected(VerifyErrorInfo{VerifyError::OpenFailed, "Is a directory", path});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(VerifyErrorInfo{VerifyError::OpenFailed, "Failed to open file", path});
    }

    auto ctx = new_md5_context();
    if (!ctx) {
        return std::unexpected(VerifyErrorInfo{VerifyError::DigestFailed, "Failed to initialise MD5 context", path});
    }

    std::vector<char> buffer(std::max(config.read_buffer_size, kMinReadBuffer));
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            return std::unexpected(VerifyErrorInfo{VerifyError::DigestFailed, "EVP_DigestUpdate failed", path});
        }
    }
    if (file.bad()) {
        return std::unexpected(VerifyErrorInfo{VerifyError::ReadFailed, "Failed to read file", path});
    }

    auto digest = finish(ctx.get());
    if (!digest) {
        return std::unexpected(VerifyErrorInfo{VerifyError::DigestFailed, digest.error(), path});
    }
    return *digest;
}

VerifyResult verify_checksum(
    const std::filesystem::path& path,
    std::string_view expected_digest,
    const VerifyConfig& config
) {
    auto actual = compute_file_digest(path, config);
    if (!actual) return std::unexpected(actual.error());

    if (*actual == expected_digest) return Outcome{Match{}};
    return Outcome{Mismatch{std::string(expected_digest), std::move(*actual)}};
}

} // namespace chkr
