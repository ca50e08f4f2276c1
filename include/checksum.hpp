#pragma once

#include <string>
#include <variant>
#include <expected>
#include <filesystem>

namespace chkr {

struct Match {
    bool operator==(const Match&) const = default;
};

struct Mismatch {
    std::string expected;
    std::string actual;

    bool operator==(const Mismatch&) const = default;
};

// Result of a completed comparison. A mismatch is not an error.
using Outcome = std::variant<Match, Mismatch>;

enum class VerifyError {
    NotFound,
    OpenFailed,
    ReadFailed,
    DigestFailed
};

struct VerifyErrorInfo {
    VerifyError error;
    std::string message;
    std::filesystem::path path;
};

using VerifyResult = std::expected<Outcome, VerifyErrorInfo>;

struct ChecksumRecord {
    std::string file;      // relative to the manifest directory
    std::string checksum;  // lowercase hex

    bool operator==(const ChecksumRecord&) const = default;
};

struct ChecksumResult {
    std::string file;
    VerifyResult result;
};

struct VerifyConfig {
    size_t read_buffer_size = 64 * 1024;
};

// Ordered by severity, the worst observed status wins.
enum class Status : int {
    Ok = 0,
    Mismatch = 1,
    Error = 2
};

constexpr Status worse(Status a, Status b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

constexpr int exit_code(Status s) { return static_cast<int>(s); }

Status status_of(const Outcome& outcome);
Status status_of(const VerifyResult& result);

const char* to_string(VerifyError e);
const char* to_string(Status s);

inline bool is_match(const Outcome& outcome) {
    return std::holds_alternative<Match>(outcome);
}

} // namespace chkr
