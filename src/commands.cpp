#include "commands.hpp"
#include "digest.hpp"
#include <sstream>
#include <iomanip>
#include <system_error>

namespace chkr {

std::string describe(const Outcome& outcome) {
    if (const auto* m = std::get_if<Mismatch>(&outcome)) {
        return "Mismatch { expected: " + m->expected + ", actual: " + m->actual + " }";
    }
    return "Match";
}

std::string describe(const VerifyErrorInfo& error) {
    return error.path.string() + ": " + error.message + " (" + to_string(error.error) + ")";
}

std::string describe(const RecordParseErrorInfo& error) {
    return "line " + std::to_string(error.line_number) + ": " + error.message;
}

std::string describe(const ManifestErrorInfo& error) {
    return error.path.string() + ": " + error.message + " (" + to_string(error.error) + ")";
}

std::string format_progress(const VerifyProgress& progress) {
    std::ostringstream oss;
    oss << "(" << progress.processed << "/" << progress.total << " "
        << std::fixed << std::setprecision(2) << progress.percentage() << "%)";
    return oss.str();
}

Status run_manifest(ManifestVerifier& verifier, const ProgressCallback& on_entry) {
    Status status = Status::Ok;
    for (const auto& entry : verifier) {
        status = worse(status, status_of(entry));
        if (on_entry) on_entry(verifier.progress(), entry);
    }
    return status;
}

int cmd_file(const std::filesystem::path& file, const std::string& expected, const CliOptions& options) {
    std::error_code ec;
    auto resolved = std::filesystem::canonical(file, ec);
    if (ec) {
        compact::Writer::failure("Error verifying checksum: " + file.string() + ": " + ec.message() + "\n");
        return exit_code(Status::Error);
    }

    auto result = verify_checksum(resolved, expected, options.verify);
    if (!result) {
        compact::Writer::failure("Error verifying checksum for " + resolved.string() + ": " + describe(result.error()) + "\n");
        return exit_code(Status::Error);
    }
    if (is_match(*result)) {
        compact::Writer::print(resolved.string() + " checksum matched\n");
    } else {
        compact::Writer::failure(resolved.string() + " checksum mismatch: " + describe(*result) + "\n");
    }
    return exit_code(status_of(*result));
}

int cmd_manifest(const std::filesystem::path& manifest, const CliOptions& options) {
    auto verifier = verify_manifest(manifest, options.verify);
    if (!verifier) {
        compact::Writer::failure("Error verifying checksum: " + describe(verifier.error()) + "\n");
        return exit_code(Status::Error);
    }

    auto report = [](const VerifyProgress& progress, const ManifestEntry& entry) {
        auto prefix = format_progress(progress) + " ";
        if (!entry) {
            compact::Writer::failure(prefix + "Error: " + describe(entry.error()) + "\n");
        } else if (!entry->result) {
            compact::Writer::failure(prefix + entry->file + ": Error: " + describe(entry->result.error()) + "\n");
        } else if (!is_match(*entry->result)) {
            compact::Writer::failure(prefix + entry->file + ": Error: " + describe(*entry->result) + "\n");
        } else {
            compact::Writer::print(prefix + entry->file + ": Match\n");
        }
    };

    Status status = run_manifest(*verifier, report);
    compact::Writer::debug(std::string("[manifest] status ") + to_string(status) +
                           ", pipeline " + to_string(verifier->state()) + "\n");
    return exit_code(status);
}

} // namespace chkr
