#pragma once

#include "checksum.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <expected>
#include <optional>
#include <functional>
#include <iosfwd>
#include <iterator>
#include <cstddef>

namespace chkr {

enum class RecordParseError {
    WrongFieldCount
};

struct RecordParseErrorInfo {
    RecordParseError error;
    std::string message;
    size_t line_number = 0;  // 1-based
    std::string line;
};

enum class ManifestError {
    NotFound,
    Unresolvable,
    OpenFailed,
    ReadFailed
};

struct ManifestErrorInfo {
    ManifestError error;
    std::string message;
    std::filesystem::path path;
};

using ParsedRecord = std::expected<ChecksumRecord, RecordParseErrorInfo>;

// One element of the verification stream. A row that failed to parse and a
// file that failed to hash are different types.
using ManifestEntry = std::expected<ChecksumResult, RecordParseErrorInfo>;

enum class PipelineState {
    Created,
    Draining,
    Exhausted
};

struct VerifyProgress {
    size_t processed = 0;
    size_t total = 0;

    double percentage() const {
        return total > 0 ? (100.0 * processed / total) : 100.0;
    }
};

using ProgressCallback = std::function<void(const VerifyProgress&, const ManifestEntry&)>;

// Parse one "<digest>  <filename>" row. nullopt means the row is dropped
// without an error (blank line, empty digest or empty filename).
// The filename is the last non-empty field, so names containing spaces are
// not supported, matching the delimited-row format md5sum output is read as.
std::optional<ParsedRecord> parse_manifest_line(std::string_view line, size_t line_number);

std::expected<std::vector<ParsedRecord>, ManifestErrorInfo> parse_manifest(std::istream& in);
std::expected<std::vector<ParsedRecord>, ManifestErrorInfo> parse_manifest(const std::filesystem::path& path);

// Single-pass lazy verification of a parsed manifest. Each next() hashes
// at most one file.
class ManifestVerifier {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ManifestEntry;
        using difference_type = std::ptrdiff_t;
        using reference = const ManifestEntry&;
        using pointer = const ManifestEntry*;

        iterator() = default;
        explicit iterator(ManifestVerifier* owner) : owner_(owner), current_(owner->next()) {}

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            current_ = owner_->next();
            return *this;
        }
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) { return !it.current_; }

    private:
        ManifestVerifier* owner_ = nullptr;
        std::optional<ManifestEntry> current_;
    };

    ManifestVerifier(
        std::filesystem::path manifest_path,
        std::filesystem::path working_directory,
        std::vector<ParsedRecord> records,
        VerifyConfig config = {}
    );

    ManifestVerifier(const ManifestVerifier&) = delete;
    ManifestVerifier& operator=(const ManifestVerifier&) = delete;
    ManifestVerifier(ManifestVerifier&&) noexcept = default;
    ManifestVerifier& operator=(ManifestVerifier&&) noexcept = default;

    std::optional<ManifestEntry> next();

    iterator begin() { return iterator(this); }
    std::default_sentinel_t end() { return std::default_sentinel; }

    size_t total() const { return total_; }
    size_t processed() const { return cursor_; }
    VerifyProgress progress() const { return VerifyProgress{cursor_, total_}; }
    PipelineState state() const { return state_; }

    const std::filesystem::path& manifest_path() const { return manifest_path_; }
    const std::filesystem::path& working_directory() const { return working_directory_; }

private:
    std::filesystem::path manifest_path_;
    std::filesystem::path working_directory_;
    std::vector<ParsedRecord> records_;
    VerifyConfig config_;
    size_t total_ = 0;
    size_t cursor_ = 0;
    PipelineState state_ = PipelineState::Created;
};

// Resolve the manifest, parse every row up front and return the lazy
// verifier. Files are resolved against the manifest's own directory.
std::expected<ManifestVerifier, ManifestErrorInfo> verify_manifest(
    const std::filesystem::path& manifest_path,
    const VerifyConfig& config = {}
);

const char* to_string(RecordParseError e);
const char* to_string(ManifestError e);
const char* to_string(PipelineState s);

Status status_of(const ManifestEntry& entry);

} // namespace chkr
