// conf/profiles.cpp - Camera profile loading
#include "profiles.hpp"
#include "../core/errors.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>

namespace offload {

fs::path CameraProfile::day_folder(const std::string &import_date) const {
  std::string rel = destination_template;
  const std::string token = DATE_TOKEN;
  size_t pos;
  while ((pos = rel.find(token)) != std::string::npos) {
    rel.replace(pos, token.size(), import_date);
  }
  return fs::path(name) / rel;
}

const char *source_kind_to_string(SourceKind kind) {
  return kind == SourceKind::Photo ? "photos" : "videos";
}

ProfileSet share_profiles(std::vector<CameraProfile> profiles) {
  ProfileSet shared;
  shared.reserve(profiles.size());
  for (auto &p : profiles) {
    shared.push_back(std::make_shared<const CameraProfile>(std::move(p)));
  }
  return shared;
}

static std::string strip_quotes(const std::string &s) {
  return trim(s, " \t\"'");
}

[[noreturn]] static void config_fail(const std::string &origin, int line_no,
                        const std::string &msg) {
  throw OffloadError(ErrorKind::ConfigError,
                     origin + ":" + std::to_string(line_no) + ": " + msg);
}

// "DCIM required" / "PRIVATE/M4ROOT optional" / "DCIM"
static FolderRule parse_folder(const std::string &value) {
  FolderRule rule;
  std::string path = value;
  auto sp = value.find_last_of(" \t");
  if (sp != std::string::npos) {
    std::string flag = to_lower(trim(value.substr(sp + 1)));
    if (flag == "required" || flag == "optional") {
      rule.required = (flag == "required");
      path = value.substr(0, sp);
    }
  }
  rule.path = strip_quotes(path);
  return rule;
}

// "ILCE-7C 100" / "\"FinePix XP150\" 80" / "OsmoPocket3"
static PatternRule parse_pattern(const std::string &value) {
  PatternRule rule;
  std::string pattern = value;
  auto sp = value.find_last_of(" \t");
  if (sp != std::string::npos) {
    std::string last = trim(value.substr(sp + 1));
    bool numeric = !last.empty() &&
                   last.size() <= 9 &&
                   last.find_first_not_of("0123456789") == std::string::npos;
    if (numeric) {
      rule.confidence = std::stoi(last);
      pattern = value.substr(0, sp);
    }
  }
  rule.pattern = strip_quotes(pattern);
  return rule;
}

// "DCIM : arw, jpg, .JPEG"
static SourceTree parse_source(SourceKind kind, const std::string &value) {
  SourceTree tree;
  tree.kind = kind;
  auto colon = value.rfind(':');
  if (colon == std::string::npos) {
    tree.path = strip_quotes(value);
    return tree;
  }
  tree.path = strip_quotes(value.substr(0, colon));
  for (auto ext : split_list(value.substr(colon + 1), ',')) {
    ext = to_lower(strip_quotes(ext));
    if (!ext.empty() && ext[0] == '.')
      ext.erase(0, 1);
    if (!ext.empty())
      tree.extensions.insert(ext);
  }
  return tree;
}

static void check_profile(const CameraProfile &profile,
                          const std::string &origin) {
  auto fail = [&](const std::string &msg) {
    throw OffloadError(ErrorKind::ConfigError,
                       origin + ": profile '" + profile.name + "': " + msg);
  };
  if (profile.sources.empty())
    fail("no photos/videos source registered");
  for (const auto &src : profile.sources) {
    if (src.path.empty())
      fail("empty source path");
    if (src.extensions.empty())
      fail("source " + src.path + " has no extensions");
    if (fs::path(src.path).is_absolute())
      fail("source " + src.path + " must be relative to the volume");
  }
  if (profile.destination_template.find(DATE_TOKEN) == std::string::npos)
    fail("destination template lacks " + std::string(DATE_TOKEN));
  if (profile.pattern_rules.empty())
    LOG_WARN(origin + ": profile '" + profile.name +
             "' has no metadata patterns and can never be identified");
}

std::vector<CameraProfile> parse_profiles(std::istream &in,
                                          const std::string &origin) {
  std::vector<CameraProfile> profiles;
  CameraProfile *current = nullptr;

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    line_no++;
    line = trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';')
      continue;

    if (line.front() == '[') {
      if (line.back() != ']')
        config_fail(origin, line_no, "unterminated section header");
      std::string name = trim(line.substr(1, line.size() - 2));
      if (name.empty())
        config_fail(origin, line_no, "empty profile name");
      for (const auto &p : profiles) {
        if (p.name == name)
          config_fail(origin, line_no, "duplicate profile '" + name + "'");
      }
      profiles.emplace_back();
      current = &profiles.back();
      current->name = name;
      continue;
    }

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos)
      config_fail(origin, line_no, "expected key = value");
    if (!current)
      config_fail(origin, line_no, "entry outside of a [profile] section");

    std::string key = to_lower(trim(line.substr(0, eq_pos)));
    std::string value = trim(line.substr(eq_pos + 1));

    if (key == "folder")
      current->folder_rules.push_back(parse_folder(value));
    else if (key == "pattern")
      current->pattern_rules.push_back(parse_pattern(value));
    else if (key == "photos")
      current->sources.push_back(parse_source(SourceKind::Photo, value));
    else if (key == "videos")
      current->sources.push_back(parse_source(SourceKind::Video, value));
    else if (key == "destination")
      current->destination_template = strip_quotes(value);
    else
      LOG_WARN(origin + ":" + std::to_string(line_no) +
               ": unknown profile key " + key);
  }

  for (const auto &profile : profiles) {
    check_profile(profile, origin);
  }
  return profiles;
}

std::vector<CameraProfile> load_profiles(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw OffloadError(ErrorKind::ConfigError,
                       "Cannot open profiles file " + path.string());
  }
  auto profiles = parse_profiles(file, path.string());
  if (profiles.empty()) {
    throw OffloadError(ErrorKind::ConfigError,
                       "No camera profiles defined in " + path.string());
  }
  LOG_DEBUG("Loaded " + std::to_string(profiles.size()) +
            " camera profiles from " + path.string());
  return profiles;
}

} // namespace offload
