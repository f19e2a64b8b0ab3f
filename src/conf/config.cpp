// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../core/errors.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>

namespace offload {

static int parse_int(const std::string &key, const std::string &value) {
  try {
    size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    throw OffloadError(ErrorKind::ConfigError,
                       "Invalid integer for " + key + ": " + value);
  }
}

static bool parse_bool(const std::string &key, const std::string &value) {
  std::string v = to_lower(value);
  if (v == "true" || v == "yes" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "0")
    return false;
  throw OffloadError(ErrorKind::ConfigError,
                     "Invalid boolean for " + key + ": " + value);
}

Config Config::make_default() {
  Config config;
  config.profiles_file = fs::path(BASE_DIR) / PROFILES_FILENAME;
  config.store_root = DEFAULT_STORE_ROOT;
  config.staging_root = DEFAULT_STAGING_ROOT;
  config.audit_dir = DEFAULT_AUDIT_DIR;
  config.log_file = DEFAULT_LOG_FILE;
  config.probe_timeout_ms = DEFAULT_PROBE_TIMEOUT_MS;
  config.transfer_retries = DEFAULT_TRANSFER_RETRIES;
  config.retry_backoff_ms = DEFAULT_RETRY_BACKOFF_MS;
  config.digest_workers = DEFAULT_DIGEST_WORKERS;
  config.metadata_samples = DEFAULT_METADATA_SAMPLES;
  config.confidence_threshold = DEFAULT_CONFIDENCE_THRESHOLD;
  return config;
}

Config Config::load_default() {
  // Try to load from default location if exists
  fs::path default_path = fs::path(BASE_DIR) / CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    return from_file(default_path);
  }
  return make_default();
}

Config Config::from_file(const fs::path &path) {
  Config config = make_default();

  std::ifstream file(path);
  if (!file.is_open()) {
    throw OffloadError(ErrorKind::ConfigError,
                       "Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN("Ignoring malformed config line: " + line);
      continue;
    }

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1), " \t\"");

    if (key == "profiles_file")
      config.profiles_file = value;
    else if (key == "store_root")
      config.store_root = value;
    else if (key == "staging_root")
      config.staging_root = value;
    else if (key == "store_host")
      config.store_host = value;
    else if (key == "store_port")
      config.store_port = parse_int(key, value);
    else if (key == "probe_timeout_ms")
      config.probe_timeout_ms = parse_int(key, value);
    else if (key == "delete_after_verify")
      config.delete_after_verify = parse_bool(key, value);
    else if (key == "transfer_retries")
      config.transfer_retries = parse_int(key, value);
    else if (key == "retry_backoff_ms")
      config.retry_backoff_ms = parse_int(key, value);
    else if (key == "digest_workers")
      config.digest_workers = parse_int(key, value);
    else if (key == "metadata_samples")
      config.metadata_samples = parse_int(key, value);
    else if (key == "confidence_threshold")
      config.confidence_threshold = parse_int(key, value);
    else if (key == "metadata_reader")
      config.metadata_reader = to_lower(value);
    else if (key == "audit_dir")
      config.audit_dir = value;
    else if (key == "report_file")
      config.report_file = value;
    else if (key == "notify_command")
      config.notify_command = value;
    else if (key == "require_confirmation")
      config.require_confirmation = parse_bool(key, value);
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "verbose")
      config.verbose = parse_bool(key, value);
    else
      LOG_WARN("Unknown config key: " + key);
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# Offload Configuration\n";
  file << "profiles_file = \"" << profiles_file.string() << "\"\n";
  file << "store_root = \"" << store_root.string() << "\"\n";
  file << "staging_root = \"" << staging_root.string() << "\"\n";
  file << "store_host = \"" << store_host << "\"\n";
  file << "store_port = " << store_port << "\n";
  file << "probe_timeout_ms = " << probe_timeout_ms << "\n";
  file << "delete_after_verify = " << (delete_after_verify ? "true" : "false")
       << "\n";
  file << "transfer_retries = " << transfer_retries << "\n";
  file << "retry_backoff_ms = " << retry_backoff_ms << "\n";
  file << "digest_workers = " << digest_workers << "\n";
  file << "metadata_samples = " << metadata_samples << "\n";
  file << "confidence_threshold = " << confidence_threshold << "\n";
  file << "metadata_reader = \"" << metadata_reader << "\"\n";
  file << "audit_dir = \"" << audit_dir.string() << "\"\n";
  if (!report_file.empty()) {
    file << "report_file = \"" << report_file.string() << "\"\n";
  }
  if (!notify_command.empty()) {
    file << "notify_command = \"" << notify_command << "\"\n";
  }
  file << "require_confirmation = "
       << (require_confirmation ? "true" : "false") << "\n";
  file << "log_file = \"" << log_file.string() << "\"\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";

  return true;
}

void Config::merge_with_cli(const fs::path &profiles_override,
                            const fs::path &store_override,
                            const fs::path &staging_override,
                            bool delete_override, bool skip_confirmation,
                            bool verbose_override) {
  if (!profiles_override.empty()) {
    profiles_file = profiles_override;
  }
  if (!store_override.empty()) {
    store_root = store_override;
  }
  if (!staging_override.empty()) {
    staging_root = staging_override;
  }
  if (delete_override) {
    delete_after_verify = true;
  }
  if (skip_confirmation) {
    require_confirmation = false;
  }
  if (verbose_override) {
    verbose = true;
  }
}

void Config::validate() const {
  if (store_root.empty() && staging_root.empty()) {
    throw OffloadError(ErrorKind::ConfigError,
                       "Neither store_root nor staging_root is configured");
  }
  if (transfer_retries < 0) {
    throw OffloadError(ErrorKind::ConfigError,
                       "transfer_retries must not be negative");
  }
  if (retry_backoff_ms < 0 || probe_timeout_ms <= 0) {
    throw OffloadError(ErrorKind::ConfigError,
                       "Timeouts and backoff must be positive");
  }
  if (retry_backoff_ms > MAX_RETRY_BACKOFF_MS) {
    throw OffloadError(ErrorKind::ConfigError,
                       "retry_backoff_ms must not exceed " +
                           std::to_string(MAX_RETRY_BACKOFF_MS));
  }
  // Zero would accept a camera on folder layout alone
  if (confidence_threshold < MIN_CONFIDENCE_THRESHOLD) {
    throw OffloadError(ErrorKind::ConfigError,
                       "confidence_threshold must be >= " +
                           std::to_string(MIN_CONFIDENCE_THRESHOLD));
  }
  if (digest_workers < 1 || metadata_samples < 1) {
    throw OffloadError(ErrorKind::ConfigError,
                       "digest_workers and metadata_samples must be >= 1");
  }
  if (metadata_reader != "embedded" && metadata_reader != "exiftool") {
    throw OffloadError(ErrorKind::ConfigError,
                       "Unknown metadata_reader: " + metadata_reader);
  }
}

} // namespace offload
