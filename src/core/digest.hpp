// core/digest.hpp - SHA-256 file digests
#pragma once

#include "inventory.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

struct FileRecord {
  std::string relative;
  uint64_t size = 0;
  std::string digest; // lower-case hex, empty when not computed
};

using RecordMap = std::map<std::string, FileRecord>;

// Throws std::runtime_error on I/O or OpenSSL failure
std::string sha256_file(const fs::path &path);

// Hashes files on up to `workers` threads; keyed by relative path so the
// completion order never matters. The first failure is rethrown after all
// workers have stopped.
RecordMap compute_records(const std::vector<MediaFile> &files, int workers);

} // namespace offload
