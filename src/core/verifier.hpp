// core/verifier.hpp - Post-transfer integrity verification
#pragma once

#include "../conf/profiles.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

enum class Outcome { Match, SizeMismatch, ChecksumMismatch, Missing };
enum class Side { Source, Destination };

struct PathResult {
  std::string relative;
  Outcome outcome = Outcome::Match;
  std::optional<Side> missing_from; // set for Missing only
  uint64_t source_size = 0;
  uint64_t destination_size = 0;
  std::string source_digest;
  std::string destination_digest; // empty when not computed
};

struct VerificationReport {
  std::vector<PathResult> results; // sorted by relative path
  bool passed = false;

  size_t count(Outcome outcome) const;
  // One line per failing path, capped at `limit` lines
  std::string describe_failures(size_t limit = 20) const;
};

const char *outcome_to_string(Outcome outcome);
const char *side_to_string(Side side);

// Inventories both sides with the same filter, hashes them and compares by
// relative path. The destination digest is skipped for paths whose sizes
// already differ. Throws OffloadError(VerificationError) when a side cannot
// be read at all.
VerificationReport verify_transfer(const fs::path &source_root,
                                   const fs::path &day_folder,
                                   const CameraProfile &profile,
                                   int workers);

} // namespace offload
