// core/metadata.hpp - Embedded media metadata readers
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace offload {

// Returns the file's metadata as text, one tag or string per line.
// Throws std::runtime_error when the file cannot be inspected.
class MetadataReader {
public:
  virtual ~MetadataReader() = default;
  virtual std::string read(const fs::path &file) = 0;
  virtual const char *name() const = 0;
};

// Printable ASCII runs from the head of the file. EXIF IFD0 Make/Model and
// XMP packets sit in the first blocks of JPEG, ARW/TIFF and HEIF files.
class EmbeddedTagReader : public MetadataReader {
public:
  std::string read(const fs::path &file) override;
  const char *name() const override { return "embedded"; }
};

// Delegates to the exiftool binary; returns its full tag listing,
// one `Tag Name : value` line per tag.
class ExiftoolReader : public MetadataReader {
public:
  explicit ExiftoolReader(std::string binary = "exiftool")
      : binary_(std::move(binary)) {}
  std::string read(const fs::path &file) override;
  const char *name() const override { return "exiftool"; }

private:
  std::string binary_;
};

std::unique_ptr<MetadataReader> make_metadata_reader(const std::string &kind);

} // namespace offload
