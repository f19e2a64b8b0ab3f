// core/identify.cpp - Camera identification implementation
#include "identify.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include "inventory.hpp"
#include <fnmatch.h>
#include <sstream>

namespace offload {

static constexpr int EXCERPT_LINES = 20;

static std::string excerpt(const std::string &text) {
  std::istringstream in(text);
  std::string line;
  std::string out;
  int count = 0;
  while (count < EXCERPT_LINES && std::getline(in, line)) {
    out += line;
    out += '\n';
    count++;
  }
  return out;
}

const std::optional<std::string> &Volume::metadata(const fs::path &file) {
  auto key = file.string();
  auto it = cache_.find(key);
  if (it != cache_.end()) {
    return it->second;
  }

  std::optional<std::string> text;
  try {
    text = reader_.read(file);
  } catch (const std::exception &e) {
    // An unreadable sample only lowers confidence; identification stays
    // fail-closed
    LOG_WARN(std::string("Metadata read (") + reader_.name() +
             ") failed for " + file.string() + ": " + e.what());
  }
  return cache_.emplace(key, std::move(text)).first->second;
}

bool pattern_matches(const std::string &pattern, const std::string &metadata) {
  if (pattern.empty()) {
    return false;
  }
  if (pattern.find_first_of("*?[") == std::string::npos) {
    return metadata.find(pattern) != std::string::npos;
  }

  std::istringstream in(metadata);
  std::string line;
  while (std::getline(in, line)) {
    if (fnmatch(pattern.c_str(), line.c_str(), 0) == 0) {
      return true;
    }
  }
  return false;
}

std::optional<Confidence> ProfileDetector::evaluate(Volume &volume) const {
  const auto &profile = *profile_;

  for (const auto &rule : profile.folder_rules) {
    fs::path p = volume.root() / rule.path;
    std::error_code ec;
    bool present = fs::exists(p, ec);
    if (rule.required && !present) {
      LOG_DEBUG("[" + profile.name + "] required path missing: " + rule.path);
      return std::nullopt;
    }
    if (present) {
      LOG_DEBUG("[" + profile.name + "] found " + rule.path);
    }
  }

  std::vector<MediaFile> samples;
  try {
    samples = scan_media_kind(volume.root(), profile, SourceKind::Photo,
                              sample_count_);
    if (samples.empty()) {
      samples = scan_media_kind(volume.root(), profile, SourceKind::Video,
                                sample_count_);
    }
  } catch (const fs::filesystem_error &e) {
    LOG_WARN("[" + profile.name + "] cannot list sample files: " + e.what());
  }

  Confidence confidence;
  std::vector<std::string> texts;
  for (const auto &sample : samples) {
    MetadataSample ms;
    ms.relative = sample.relative;
    const auto &text = volume.metadata(sample.absolute);
    if (text) {
      ms.excerpt = excerpt(*text);
      texts.push_back(*text);
    } else {
      ms.readable = false;
    }
    confidence.samples.push_back(std::move(ms));
  }

  // Each pattern counts once, whichever sample carries it
  for (const auto &rule : profile.pattern_rules) {
    for (const auto &text : texts) {
      if (pattern_matches(rule.pattern, text)) {
        confidence.score += rule.confidence;
        confidence.matched_patterns.push_back(rule.pattern);
        break;
      }
    }
  }

  return confidence;
}

CameraIdentifier CameraIdentifier::from_profiles(const ProfileSet &profiles,
                                                 int sample_count,
                                                 int threshold) {
  std::vector<std::unique_ptr<Detector>> detectors;
  detectors.reserve(profiles.size());
  for (const auto &profile : profiles) {
    detectors.push_back(
        std::make_unique<ProfileDetector>(profile, sample_count));
  }
  return CameraIdentifier(std::move(detectors), threshold);
}

Identification CameraIdentifier::identify(const fs::path &root,
                                          MetadataReader &reader) const {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw OffloadError(ErrorKind::UnidentifiedCamera,
                       "Source is not a directory: " + root.string());
  }

  Volume volume(root, reader);
  std::ostringstream diag;

  for (const auto &detector : detectors_) {
    auto profile = detector->profile();
    auto result = detector->evaluate(volume);
    if (!result) {
      diag << "[" << profile->name << "] structure mismatch\n";
      continue;
    }

    LOG_DEBUG("[" + profile->name + "] confidence " +
              std::to_string(result->score) + "/" +
              std::to_string(threshold_));

    // Folder layout alone never identifies a camera
    if (result->score > 0 && result->score >= threshold_) {
      LOG_INFO("Camera detected: " + profile->name + " (confidence " +
               std::to_string(result->score) + ")");
      return Identification{profile, std::move(*result)};
    }

    diag << "[" << profile->name << "] confidence " << result->score
         << " below threshold " << threshold_ << "\n";
    for (const auto &sample : result->samples) {
      diag << "  sample " << sample.relative;
      if (!sample.readable) {
        diag << " (unreadable)\n";
        continue;
      }
      diag << ":\n" << sample.excerpt;
    }
  }

  LOG_ERROR("No supported camera type detected in source: " + root.string());
  throw OffloadError(ErrorKind::UnidentifiedCamera,
                     "No camera profile matched " + root.string(), diag.str());
}

} // namespace offload
