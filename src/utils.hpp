// utils.hpp - Utility functions
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
  std::mutex mutex_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool is_writable_dir(const fs::path &path);
bool is_hidden_or_system(const fs::path &relative);
std::string lower_extension(const fs::path &path);
bool fsync_path(const fs::path &path);
void remove_empty_dirs(const fs::path &root);

// String utilities
std::string trim(const std::string &s, const char *chars = " \t");
std::string to_lower(std::string s);
std::vector<std::string> split_list(const std::string &value, char sep);
std::string json_escape(const std::string &s);
std::string format_size(uint64_t bytes);

// Time
std::string today_stamp();
std::string timestamp_now();

// Process utilities
int run_capture(const std::string &cmd, std::string &output);
std::string shell_quote(const std::string &s);

// Temp directory
fs::path make_scratch_dir(const std::string &prefix);
void cleanup_temp_dir(const fs::path &temp_dir);

} // namespace offload
