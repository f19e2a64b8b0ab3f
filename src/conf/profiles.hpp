// conf/profiles.hpp - Camera profile definitions
#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

struct FolderRule {
  std::string path;
  bool required = false;
};

struct PatternRule {
  std::string pattern;
  int confidence = 50;
};

enum class SourceKind { Photo, Video };

struct SourceTree {
  SourceKind kind = SourceKind::Photo;
  std::string path;                // relative to the volume root
  std::set<std::string> extensions; // lower-case, no leading dot
};

struct CameraProfile {
  std::string name;
  std::vector<FolderRule> folder_rules;
  std::vector<PatternRule> pattern_rules;
  std::vector<SourceTree> sources;
  std::string destination_template = "{date}";

  // Day-folder relative to a destination root: <name>/<template>
  fs::path day_folder(const std::string &import_date) const;
};

// Profiles are immutable once loaded and shared read-only across stages
using ProfileSet = std::vector<std::shared_ptr<const CameraProfile>>;

const char *source_kind_to_string(SourceKind kind);
ProfileSet share_profiles(std::vector<CameraProfile> profiles);

// Profiles come back in file order, which is detection priority
std::vector<CameraProfile> load_profiles(const fs::path &path);
std::vector<CameraProfile> parse_profiles(std::istream &in,
                                          const std::string &origin);

} // namespace offload
