// core/metadata.cpp - Embedded media metadata readers implementation
#include "metadata.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>

namespace offload {

std::string EmbeddedTagReader::read(const fs::path &file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + file.string());
  }

  std::vector<char> buf(METADATA_SCAN_BYTES);
  in.read(buf.data(), buf.size());
  std::streamsize n = in.gcount();
  if (in.bad()) {
    throw std::runtime_error("read failed: " + file.string());
  }

  std::string text;
  std::string run;
  auto flush = [&]() {
    if (run.size() >= METADATA_MIN_RUN) {
      text += run;
      text += '\n';
    }
    run.clear();
  };

  for (std::streamsize i = 0; i < n; ++i) {
    unsigned char c = static_cast<unsigned char>(buf[i]);
    if (c >= 0x20 && c < 0x7f) {
      run += static_cast<char>(c);
    } else {
      flush();
    }
  }
  flush();
  return text;
}

std::string ExiftoolReader::read(const fs::path &file) {
  // Every tag: some cameras only name the model in an encoder or
  // firmware tag, not in Make/Model
  std::string cmd = binary_ + " " + shell_quote(file.string()) + " 2>/dev/null";
  std::string output;
  int ret = run_capture(cmd, output);
  if (ret != 0) {
    throw std::runtime_error(binary_ + " exited with " + std::to_string(ret) +
                             " for " + file.string());
  }
  return output;
}

std::unique_ptr<MetadataReader> make_metadata_reader(const std::string &kind) {
  if (kind == "embedded")
    return std::make_unique<EmbeddedTagReader>();
  if (kind == "exiftool")
    return std::make_unique<ExiftoolReader>();
  throw OffloadError(ErrorKind::ConfigError, "Unknown metadata reader: " + kind);
}

} // namespace offload
