// core/identify.hpp - Camera identification
#pragma once

#include "../conf/profiles.hpp"
#include "metadata.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

struct MetadataSample {
  std::string relative;
  std::string excerpt; // first lines, for diagnostics
  bool readable = true;
};

struct Confidence {
  int score = 0;
  std::vector<std::string> matched_patterns;
  std::vector<MetadataSample> samples;
};

// A mounted volume under inspection. Caches metadata so several
// detectors sampling the same file read it once.
class Volume {
public:
  Volume(fs::path root, MetadataReader &reader)
      : root_(std::move(root)), reader_(reader) {}

  const fs::path &root() const { return root_; }
  // Empty optional when the reader failed on this file
  const std::optional<std::string> &metadata(const fs::path &file);

private:
  fs::path root_;
  MetadataReader &reader_;
  std::map<std::string, std::optional<std::string>> cache_;
};

class Detector {
public:
  virtual ~Detector() = default;
  virtual std::shared_ptr<const CameraProfile> profile() const = 0;
  // nullopt when the volume is structurally incompatible with the camera
  virtual std::optional<Confidence> evaluate(Volume &volume) const = 0;
};

class ProfileDetector : public Detector {
public:
  ProfileDetector(std::shared_ptr<const CameraProfile> profile,
                  int sample_count)
      : profile_(std::move(profile)), sample_count_(sample_count) {}

  std::shared_ptr<const CameraProfile> profile() const override {
    return profile_;
  }
  std::optional<Confidence> evaluate(Volume &volume) const override;

private:
  std::shared_ptr<const CameraProfile> profile_;
  int sample_count_;
};

struct Identification {
  std::shared_ptr<const CameraProfile> profile;
  Confidence confidence;
};

class CameraIdentifier {
public:
  CameraIdentifier(std::vector<std::unique_ptr<Detector>> detectors,
                   int threshold)
      : detectors_(std::move(detectors)), threshold_(threshold) {}

  static CameraIdentifier from_profiles(const ProfileSet &profiles,
                                        int sample_count, int threshold);

  // Throws OffloadError(UnidentifiedCamera) with the sampled metadata in
  // detail() when no profile clears both the structural and the
  // confidence bar.
  Identification identify(const fs::path &root, MetadataReader &reader) const;

  size_t size() const { return detectors_.size(); }

private:
  std::vector<std::unique_ptr<Detector>> detectors_;
  int threshold_;
};

bool pattern_matches(const std::string &pattern, const std::string &metadata);

} // namespace offload
