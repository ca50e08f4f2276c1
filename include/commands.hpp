#pragma once

#include "checksum.hpp"
#include "manifest.hpp"
#include "compact_log.hpp"
#include <string>
#include <filesystem>

namespace chkr {

struct CliOptions {
    compact::Verbosity verbosity = compact::Verbosity::Normal;
    VerifyConfig verify;
};

std::string describe(const Outcome& outcome);
std::string describe(const VerifyErrorInfo& error);
std::string describe(const RecordParseErrorInfo& error);
std::string describe(const ManifestErrorInfo& error);

// "(3/10 30.00%)"
std::string format_progress(const VerifyProgress& progress);

// Drain the verifier, folding the worst status. on_entry sees every element
// in manifest order together with the progress after it.
Status run_manifest(ManifestVerifier& verifier, const ProgressCallback& on_entry = nullptr);

// Exit codes: 0 match, 1 mismatch, 2 error.
int cmd_file(const std::filesystem::path& file, const std::string& expected, const CliOptions& options = {});
int cmd_manifest(const std::filesystem::path& manifest, const CliOptions& options = {});

} // namespace chkr
