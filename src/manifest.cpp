#include "manifest.hpp"
#include "digest.hpp"
#include "compact_log.hpp"
#include <fstream>
#include <istream>
#include <system_error>

namespace chkr {

namespace {

bool is_delimiter(char c) { return c == ' ' || c == '\t'; }

// Split on every single delimiter, keeping empty fields.
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        if (is_delimiter(line[i])) {
            fields.push_back(line.substr(start, i - start));
            start = i + 1;
        }
    }
    fields.push_back(line.substr(start));
    return fields;
}

} // namespace

std::optional<ParsedRecord> parse_manifest_line(std::string_view line, size_t line_number) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) return std::nullopt;

    auto fields = split_fields(line);
    if (fields.size() < 2) {
        return ParsedRecord(std::unexpect, RecordParseErrorInfo{
            RecordParseError::WrongFieldCount,
            "expected '<digest> <filename>', found a single field",
            line_number,
            std::string(line)
        });
    }

    std::string_view digest = fields.front();
    std::string_view file;
    for (size_t i = fields.size() - 1; i > 0; --i) {
        if (!fields[i].empty()) {
            file = fields[i];
            break;
        }
    }
    // md5sum -b marks binary mode with a leading '*'
    if (file.size() > 1 && file.front() == '*') file.remove_prefix(1);

    if (digest.empty() || file.empty()) return std::nullopt;

    return ParsedRecord(ChecksumRecord{std::string(file), std::string(digest)});
}

std::expected<std::vector<ParsedRecord>, ManifestErrorInfo> parse_manifest(std::istream& in) {
    std::vector<ParsedRecord> records;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (auto parsed = parse_manifest_line(line, line_number)) {
            records.push_back(std::move(*parsed));
        }
    }
    if (in.bad()) {
        return std::unexpected(ManifestErrorInfo{ManifestError::ReadFailed, "Failed to read manifest", {}});
    }
    return records;
}

std::expected<std::vector<ParsedRecord>, ManifestErrorInfo> parse_manifest(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ManifestErrorInfo{ManifestError::OpenFailed, "Failed to open manifest", path});
    }
    auto records = parse_manifest(file);
    if (!records) {
        auto err = records.error();
        err.path = path;
        return std::unexpected(std::move(err));
    }
    return records;
}

ManifestVerifier::ManifestVerifier(
    std::filesystem::path manifest_path,
    std::filesystem::path working_directory,
    std::vector<ParsedRecord> records,
    VerifyConfig config
) : manifest_path_(std::move(manifest_path)),
    working_directory_(std::move(working_directory)),
    records_(std::move(records)),
    config_(config),
    total_(records_.size()) {}

std::optional<ManifestEntry> ManifestVerifier::next() {
    if (cursor_ >= records_.size()) {
        state_ = PipelineState::Exhausted;
        return std::nullopt;
    }

    ParsedRecord record = std::move(records_[cursor_++]);
    state_ = cursor_ == records_.size() ? PipelineState::Exhausted : PipelineState::Draining;

    if (!record) {
        compact::Writer::debug("[manifest] line " + std::to_string(record.error().line_number) + " failed to parse\n");
        return ManifestEntry(std::unexpect, std::move(record.error()));
    }

    auto file_path = working_directory_ / record->file;
    compact::Writer::debug("[manifest] hashing " + file_path.string() + "\n");
    return ManifestEntry(ChecksumResult{
        std::move(record->file),
        verify_checksum(file_path, record->checksum, config_)
    });
}

std::expected<ManifestVerifier, ManifestErrorInfo> verify_manifest(
    const std::filesystem::path& manifest_path,
    const VerifyConfig& config
) {
    std::error_code ec;
    if (!std::filesystem::exists(manifest_path, ec)) {
        return std::unexpected(ManifestErrorInfo{
            ManifestError::NotFound,
            ec ? ec.message() : "No such file or directory",
            manifest_path
        });
    }

    auto resolved = std::filesystem::canonical(manifest_path, ec);
    if (ec) {
        return std::unexpected(ManifestErrorInfo{ManifestError::Unresolvable, ec.message(), manifest_path});
    }
    if (std::filesystem::is_directory(resolved, ec)) {
        return std::unexpected(ManifestErrorInfo{ManifestError::OpenFailed, "Is a directory", resolved});
    }

    auto working_directory = resolved.parent_path();
    if (working_directory.empty()) {
        return std::unexpected(ManifestErrorInfo{
            ManifestError::Unresolvable, "Unable to compute working directory", resolved
        });
    }

    auto records = parse_manifest(resolved);
    if (!records) return std::unexpected(records.error());

    compact::Writer::debug("[manifest] " + resolved.string() + ": " + std::to_string(records->size()) + " entries\n");
    return ManifestVerifier(std::move(resolved), std::move(working_directory), std::move(*records), config);
}

const char* to_string(RecordParseError e) {
    switch (e) {
        case RecordParseError::WrongFieldCount: return "WrongFieldCount";
    }
    return "Unknown";
}

const char* to_string(ManifestError e) {
    switch (e) {
        case ManifestError::NotFound: return "NotFound";
        case ManifestError::Unresolvable: return "Unresolvable";
        case ManifestError::OpenFailed: return "OpenFailed";
        case ManifestError::ReadFailed: return "ReadFailed";
    }
    return "Unknown";
}

const char* to_string(PipelineState s) {
    switch (s) {
        case PipelineState::Created: return "Created";
        case PipelineState::Draining: return "Draining";
        case PipelineState::Exhausted: return "Exhausted";
    }
    return "Unknown";
}

Status status_of(const ManifestEntry& entry) {
    return entry ? status_of(entry->result) : Status::Error;
}

} // namespace chkr
