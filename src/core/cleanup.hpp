// core/cleanup.hpp - Source cleanup after verified transfer
#pragma once

#include "../conf/profiles.hpp"
#include "verifier.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

struct CleanupRequest {
  fs::path source_root;
  fs::path day_folder; // absolute, the audit fallback location
  fs::path audit_dir;  // empty means day-folder only
  std::string run_started;
  const CameraProfile *profile = nullptr;
  const VerificationReport *report = nullptr;
};

struct CleanupResult {
  fs::path audit_path;
  size_t deleted = 0;
  std::vector<std::string> failures;
};

// Writes the audit record, then deletes every verified source file and the
// directories that empty out beneath the source subtrees. Failures are
// collected rather than thrown. Throws std::logic_error if the report did
// not pass.
CleanupResult cleanup_source(const CleanupRequest &request);

// Path the audit record is written to. Exposed for the CLI and tests.
fs::path audit_path_for(const CleanupRequest &request);

} // namespace offload
