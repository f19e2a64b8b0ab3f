// core/executor.hpp - Transfer execution
#pragma once

#include "cancel.hpp"
#include "inventory.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

struct TransferStats {
  size_t total = 0;
  size_t copied = 0;
  size_t skipped = 0; // already present with the same size and digest
  uint64_t bytes = 0; // bytes actually written this attempt
};

// Reported after every file, copied or skipped
struct TransferProgress {
  size_t files_done = 0;
  size_t files_total = 0;
  uint64_t bytes_done = 0; // inventory bytes handled, skipped files included
  uint64_t bytes_total = 0;
  double bytes_per_second = 0; // write rate of this attempt
  std::string current;         // relative path just handled
};

using ProgressCallback = std::function<void(const TransferProgress &)>;

struct TransferControl {
  const CancellationToken *token = nullptr;
  ProgressCallback progress;
};

// Copies `src` to `dst` through `<dst>.offload-part`: data fsync'd, mtime
// carried over, then renamed into place. Throws OffloadError(TransferError).
void copy_atomic(const fs::path &src, const fs::path &dst);

// Copies every file to day_folder/<relative>, skipping files that are
// already complete. `stats` is updated as each file lands, so it still
// describes a failed attempt. Checks the token before each file; throws
// OffloadError(Cancelled) when set, OffloadError(TransferError) on I/O
// failure. Files written before the failure stay in place for resume.
void transfer_files(const std::vector<MediaFile> &files,
                    const fs::path &day_folder, const TransferControl &control,
                    TransferStats &stats);

TransferStats transfer_files(const std::vector<MediaFile> &files,
                             const fs::path &day_folder,
                             const CancellationToken *token = nullptr);

// The marker makes a day-folder resumable by a later run instead of a
// collision. It is written before the first copy and removed once the
// import has verified.
void mark_import_incomplete(const fs::path &day_folder,
                            const std::string &note);
bool mark_import_complete(const fs::path &day_folder);
bool is_import_incomplete(const fs::path &day_folder);

} // namespace offload
