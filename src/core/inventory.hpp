// core/inventory.hpp - Media file inventory
#pragma once

#include "../conf/profiles.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

struct MediaFile {
  std::string relative; // from the side's root, generic separators
  fs::path absolute;
  uint64_t size = 0;
  SourceKind kind = SourceKind::Photo;
};

// Files under the profile's source trees whose extension is registered,
// minus hidden and system entries. Sorted by relative path, no duplicates.
// The same filter is used for source and destination sides.
std::vector<MediaFile> scan_media(const fs::path &root,
                                  const CameraProfile &profile);

// Same filter restricted to one kind, capped at limit entries
std::vector<MediaFile> scan_media_kind(const fs::path &root,
                                       const CameraProfile &profile,
                                       SourceKind kind, size_t limit);

uint64_t total_bytes(const std::vector<MediaFile> &files);

} // namespace offload
