// core/verifier.cpp - Post-transfer integrity verification implementation
#include "verifier.hpp"
#include "../utils.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "inventory.hpp"
#include <map>
#include <sstream>

namespace offload {

const char *outcome_to_string(Outcome outcome) {
  switch (outcome) {
  case Outcome::Match:
    return "match";
  case Outcome::SizeMismatch:
    return "size_mismatch";
  case Outcome::ChecksumMismatch:
    return "checksum_mismatch";
  case Outcome::Missing:
    return "missing";
  }
  return "unknown";
}

const char *side_to_string(Side side) {
  return side == Side::Source ? "source" : "destination";
}

size_t VerificationReport::count(Outcome outcome) const {
  size_t n = 0;
  for (const auto &r : results) {
    if (r.outcome == outcome)
      n++;
  }
  return n;
}

std::string VerificationReport::describe_failures(size_t limit) const {
  std::ostringstream out;
  size_t shown = 0;
  size_t failing = 0;
  for (const auto &r : results) {
    if (r.outcome == Outcome::Match)
      continue;
    failing++;
    if (shown >= limit)
      continue;
    out << outcome_to_string(r.outcome) << ": " << r.relative;
    if (r.outcome == Outcome::Missing && r.missing_from) {
      out << " (absent from " << side_to_string(*r.missing_from) << ")";
    } else if (r.outcome == Outcome::SizeMismatch) {
      out << " (" << r.source_size << " != " << r.destination_size << ")";
    }
    out << "\n";
    shown++;
  }
  if (failing > shown) {
    out << "... and " << (failing - shown) << " more\n";
  }
  return out.str();
}

static std::vector<MediaFile> inventory(const fs::path &root,
                                        const CameraProfile &profile,
                                        const char *side) {
  try {
    return scan_media(root, profile);
  } catch (const fs::filesystem_error &e) {
    throw OffloadError(ErrorKind::VerificationError,
                       std::string("Cannot enumerate ") + side + " " +
                           root.string(),
                       e.what());
  }
}

static RecordMap hash_side(const std::vector<MediaFile> &files, int workers,
                           const char *side) {
  try {
    return compute_records(files, workers);
  } catch (const std::exception &e) {
    throw OffloadError(ErrorKind::VerificationError,
                       std::string("Cannot hash ") + side + " files",
                       e.what());
  }
}

VerificationReport verify_transfer(const fs::path &source_root,
                                   const fs::path &day_folder,
                                   const CameraProfile &profile,
                                   int workers) {
  auto source_files = inventory(source_root, profile, "source");
  auto dest_files = inventory(day_folder, profile, "destination");

  std::map<std::string, const MediaFile *> dest_index;
  for (const auto &f : dest_files) {
    dest_index.emplace(f.relative, &f);
  }

  // Destination files whose size already disagrees are not worth hashing
  std::vector<MediaFile> dest_to_hash;
  for (const auto &f : source_files) {
    auto it = dest_index.find(f.relative);
    if (it != dest_index.end() && it->second->size == f.size) {
      dest_to_hash.push_back(*it->second);
    }
  }

  LOG_INFO("Verifying " + std::to_string(source_files.size()) +
           " files against " + day_folder.string());
  RecordMap source_records = hash_side(source_files, workers, "source");
  RecordMap dest_records = hash_side(dest_to_hash, workers, "destination");

  std::map<std::string, PathResult> merged;
  for (const auto &f : source_files) {
    PathResult r;
    r.relative = f.relative;
    auto rec = source_records.find(f.relative);
    if (rec != source_records.end()) {
      r.source_size = rec->second.size;
      r.source_digest = rec->second.digest;
    } else {
      r.source_size = f.size;
    }

    auto d = dest_index.find(f.relative);
    if (d == dest_index.end()) {
      r.outcome = Outcome::Missing;
      r.missing_from = Side::Destination;
    } else {
      r.destination_size = d->second->size;
      auto drec = dest_records.find(f.relative);
      if (drec != dest_records.end()) {
        r.destination_size = drec->second.size;
        r.destination_digest = drec->second.digest;
      }
      if (r.source_size != r.destination_size) {
        r.outcome = Outcome::SizeMismatch;
      } else if (r.source_digest != r.destination_digest) {
        r.outcome = Outcome::ChecksumMismatch;
      } else {
        r.outcome = Outcome::Match;
      }
    }
    merged.emplace(r.relative, std::move(r));
  }

  for (const auto &f : dest_files) {
    if (merged.count(f.relative))
      continue;
    PathResult r;
    r.relative = f.relative;
    r.outcome = Outcome::Missing;
    r.missing_from = Side::Source;
    r.destination_size = f.size;
    merged.emplace(r.relative, std::move(r));
  }

  VerificationReport report;
  report.passed = true;
  report.results.reserve(merged.size());
  for (auto &[rel, r] : merged) {
    if (r.outcome != Outcome::Match) {
      report.passed = false;
      LOG_WARN(std::string("Verification ") + outcome_to_string(r.outcome) +
               ": " + rel);
    }
    report.results.push_back(std::move(r));
  }

  if (report.passed) {
    LOG_INFO("Verification passed: " + std::to_string(report.results.size()) +
             " files match");
  } else {
    LOG_ERROR("Verification failed: " +
              std::to_string(report.results.size() -
                             report.count(Outcome::Match)) +
              " of " + std::to_string(report.results.size()) +
              " paths differ");
  }
  return report;
}

} // namespace offload
