// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include "defs.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace offload {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    auto file = std::make_unique<std::ofstream>(log_path, std::ios::app);
    if (file->is_open()) {
      log_file_ = std::move(file);
    } else {
      std::cerr << "Cannot open log file " << log_path.string()
                << ", logging to stderr only\n";
    }
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  std::string log_line =
      std::string("[") + timestamp_now() + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

bool is_writable_dir(const fs::path &path) {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    return false;
  }
  return access(path.c_str(), W_OK | X_OK) == 0;
}

bool is_hidden_or_system(const fs::path &relative) {
  for (const auto &part : relative) {
    std::string name = part.string();
    if (name.empty() || name == "." || name == "..")
      continue;
    // Covers dotfiles, AppleDouble "._*", .Trashes, .Spotlight-V100
    if (name[0] == '.')
      return true;
    if (std::find(SYSTEM_ENTRIES.begin(), SYSTEM_ENTRIES.end(), name) !=
        SYSTEM_ENTRIES.end())
      return true;
  }
  return false;
}

std::string lower_extension(const fs::path &path) {
  std::string ext = path.extension().string();
  if (!ext.empty() && ext[0] == '.') {
    ext.erase(0, 1);
  }
  return to_lower(ext);
}

bool fsync_path(const fs::path &path) {
  int flags = O_RDONLY;
  if (fs::is_directory(path)) {
    flags |= O_DIRECTORY;
  }
  int fd = open(path.c_str(), flags);
  if (fd < 0) {
    LOG_DEBUG("fsync open failed for " + path.string() + ": " +
              strerror(errno));
    return false;
  }
  bool ok = fsync(fd) == 0;
  if (!ok) {
    LOG_WARN("fsync failed for " + path.string() + ": " + strerror(errno));
  }
  close(fd);
  return ok;
}

// Deepest directories first so parents empty out as children go
void remove_empty_dirs(const fs::path &root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return;
  }

  std::vector<fs::path> dirs;
  for (auto it = fs::recursive_directory_iterator(root, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_directory(ec)) {
      dirs.push_back(it->path());
    }
  }

  std::sort(dirs.begin(), dirs.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.string().size() > b.string().size();
            });

  for (const auto &dir : dirs) {
    std::error_code rm_ec;
    if (fs::is_empty(dir, rm_ec) && !rm_ec) {
      fs::remove(dir, rm_ec);
      if (!rm_ec) {
        LOG_DEBUG("Removed empty directory " + dir.string());
      }
    }
  }
}

// String utilities
std::string trim(const std::string &s, const char *chars) {
  size_t start = s.find_first_not_of(chars);
  if (start == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(chars);
  return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  for (char &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

std::vector<std::string> split_list(const std::string &value, char sep) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, sep)) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::string json_escape(const std::string &s) {
  std::ostringstream o;
  for (char c : s) {
    if (c == '"')
      o << "\\\"";
    else if (c == '\\')
      o << "\\\\";
    else if (c == '\b')
      o << "\\b";
    else if (c == '\f')
      o << "\\f";
    else if (c == '\n')
      o << "\\n";
    else if (c == '\r')
      o << "\\r";
    else if (c == '\t')
      o << "\\t";
    else if ((unsigned char)c < 0x20) {
      char buf[7];
      snprintf(buf, sizeof(buf), "\\u%04x", c);
      o << buf;
    } else
      o << c;
  }
  return o.str();
}

std::string format_size(uint64_t bytes) {
  const uint64_t KB = 1024;
  const uint64_t MB = KB * 1024;
  const uint64_t GB = MB * 1024;

  char buf[64];
  if (bytes >= GB) {
    snprintf(buf, sizeof(buf), "%.1fG", (double)bytes / GB);
  } else if (bytes >= MB) {
    snprintf(buf, sizeof(buf), "%.0fM", (double)bytes / MB);
  } else if (bytes >= KB) {
    snprintf(buf, sizeof(buf), "%.0fK", (double)bytes / KB);
  } else {
    snprintf(buf, sizeof(buf), "%luB", (unsigned long)bytes);
  }
  return std::string(buf);
}

// Time
std::string today_stamp() {
  auto now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[16];
  std::strftime(buf, sizeof(buf), IMPORT_DATE_FORMAT, &local);
  return std::string(buf);
}

std::string timestamp_now() {
  auto now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(time_buf);
}

// Process utilities
int run_capture(const std::string &cmd, std::string &output) {
  output.clear();
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    LOG_ERROR("Failed to execute: " + cmd);
    return -1;
  }

  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    output += buffer;
  }

  int ret = pclose(pipe);
  if (ret == -1) {
    return -1;
  }
  return WIFEXITED(ret) ? WEXITSTATUS(ret) : -1;
}

std::string shell_quote(const std::string &s) {
  std::string quoted = "'";
  for (char c : s) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

// Temp directory
fs::path make_scratch_dir(const std::string &prefix) {
  std::string tmpl = (fs::temp_directory_path() / (prefix + "-XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed for " + tmpl + ": " +
                             strerror(errno));
  }
  return fs::path(buf.data());
}

void cleanup_temp_dir(const fs::path &temp_dir) {
  try {
    if (fs::exists(temp_dir)) {
      fs::remove_all(temp_dir);
    }
  } catch (const std::exception &e) {
    LOG_WARN("Failed to clean up temp dir " + temp_dir.string() + ": " +
             e.what());
  }
}

} // namespace offload
