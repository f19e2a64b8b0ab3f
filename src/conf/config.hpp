// conf/config.hpp - Configuration management
#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace offload {

struct Config {
  fs::path profiles_file;
  fs::path store_root;
  fs::path staging_root;
  std::string store_host;
  int store_port = 445;
  int probe_timeout_ms = 3000;
  bool delete_after_verify = false;
  int transfer_retries = 3;
  int retry_backoff_ms = 500;
  int digest_workers = 4;
  int metadata_samples = 3;
  int confidence_threshold = 50;
  std::string metadata_reader = "embedded"; // "embedded" or "exiftool"
  fs::path audit_dir;
  fs::path report_file;
  std::string notify_command;
  bool require_confirmation = false;
  fs::path log_file;
  bool verbose = false;

  static Config make_default();
  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &profiles_override,
                      const fs::path &store_override,
                      const fs::path &staging_override, bool delete_override,
                      bool skip_confirmation, bool verbose_override);

  // Throws ConfigError on values the pipeline cannot run with
  void validate() const;
};

} // namespace offload
