// core/executor.cpp - Transfer execution implementation
#include "executor.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <set>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace offload {

namespace {

class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;

  int get() const { return fd_; }
  // Close explicitly so the error is not lost
  int close() {
    int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

private:
  int fd_;
};

[[noreturn]] void fail(const std::string &what, const fs::path &path) {
  int err = errno;
  throw OffloadError(ErrorKind::TransferError,
                     what + " " + path.string() + ": " + strerror(err));
}

bool write_all(int fd, const char *data, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

void copy_contents(const fs::path &src, const fs::path &part) {
  FdGuard in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.get() < 0) {
    fail("Cannot open source", src);
  }

  FdGuard out(
      ::open(part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (out.get() < 0) {
    fail("Cannot create", part);
  }

  std::vector<char> buffer(COPY_CHUNK_BYTES);
  while (true) {
    ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      fail("Read failed on", src);
    }
    if (n == 0)
      break;
    if (!write_all(out.get(), buffer.data(), static_cast<size_t>(n))) {
      fail("Write failed on", part);
    }
  }

  if (::fsync(out.get()) != 0) {
    fail("fsync failed on", part);
  }
  if (out.close() != 0) {
    fail("Close failed on", part);
  }
}

// Size first, digest only when sizes agree
bool already_complete(const MediaFile &file, const fs::path &dst) {
  std::error_code ec;
  if (!fs::is_regular_file(fs::symlink_status(dst, ec)) || ec) {
    return false;
  }
  auto size = fs::file_size(dst, ec);
  if (ec || size != file.size) {
    LOG_DEBUG("Size differs, recopying " + file.relative);
    return false;
  }

  try {
    if (sha256_file(file.absolute) == sha256_file(dst)) {
      return true;
    }
  } catch (const std::exception &e) {
    throw OffloadError(ErrorKind::TransferError,
                       "Cannot compare existing copy of " + file.relative,
                       e.what());
  }
  LOG_DEBUG("Digest differs, recopying " + file.relative);
  return false;
}

} // namespace

void copy_atomic(const fs::path &src, const fs::path &dst) {
  fs::path part = dst;
  part += PART_SUFFIX;

  try {
    copy_contents(src, part);

    std::error_code ec;
    auto mtime = fs::last_write_time(src, ec);
    if (!ec) {
      fs::last_write_time(part, mtime, ec);
    }
    if (ec) {
      LOG_WARN("Cannot carry mtime to " + dst.string() + ": " + ec.message());
    }

    fs::rename(part, dst, ec);
    if (ec) {
      throw OffloadError(ErrorKind::TransferError,
                         "Cannot rename " + part.string() + " into place: " +
                             ec.message());
    }
  } catch (const OffloadError &) {
    std::error_code rm_ec;
    fs::remove(part, rm_ec);
    throw;
  }

  fsync_path(dst.parent_path());
}

void transfer_files(const std::vector<MediaFile> &files,
                    const fs::path &day_folder, const TransferControl &control,
                    TransferStats &stats) {
  stats = TransferStats();
  stats.total = files.size();

  std::error_code ec;
  fs::create_directories(day_folder, ec);
  if (ec) {
    throw OffloadError(ErrorKind::TransferError,
                       "Cannot create " + day_folder.string() + ": " +
                           ec.message());
  }

  TransferProgress progress;
  progress.files_total = files.size();
  progress.bytes_total = total_bytes(files);
  auto started = std::chrono::steady_clock::now();

  std::set<fs::path> synced_dirs;
  for (const auto &file : files) {
    if (control.token && control.token->cancelled()) {
      LOG_WARN("Transfer cancelled after " + std::to_string(stats.copied) +
               " copied, " + std::to_string(stats.skipped) + " skipped");
      throw OffloadError(ErrorKind::Cancelled, "Transfer cancelled");
    }

    fs::path dst = day_folder / fs::path(file.relative);
    fs::path parent = dst.parent_path();
    if (synced_dirs.insert(parent).second) {
      fs::create_directories(parent, ec);
      if (ec) {
        throw OffloadError(ErrorKind::TransferError,
                           "Cannot create " + parent.string() + ": " +
                               ec.message());
      }
    }

    if (already_complete(file, dst)) {
      LOG_DEBUG("Skipping complete " + file.relative);
      stats.skipped++;
    } else {
      copy_atomic(file.absolute, dst);
      stats.copied++;
      stats.bytes += file.size;
      LOG_DEBUG("Copied " + file.relative + " (" + format_size(file.size) +
                ")");
    }

    if (control.progress) {
      std::chrono::duration<double> elapsed =
          std::chrono::steady_clock::now() - started;
      progress.files_done++;
      progress.bytes_done += file.size;
      progress.bytes_per_second =
          elapsed.count() > 0 ? static_cast<double>(stats.bytes) / elapsed.count()
                              : 0;
      progress.current = file.relative;
      control.progress(progress);
    }
  }

  fsync_path(day_folder);
  LOG_INFO("Transfer complete: " + std::to_string(stats.copied) +
           " copied, " + std::to_string(stats.skipped) + " already present, " +
           format_size(stats.bytes) + " written");
}

TransferStats transfer_files(const std::vector<MediaFile> &files,
                             const fs::path &day_folder,
                             const CancellationToken *token) {
  TransferControl control;
  control.token = token;
  TransferStats stats;
  transfer_files(files, day_folder, control, stats);
  return stats;
}

void mark_import_incomplete(const fs::path &day_folder,
                            const std::string &note) {
  std::error_code ec;
  fs::create_directories(day_folder, ec);
  if (ec) {
    throw OffloadError(ErrorKind::TransferError,
                       "Cannot create " + day_folder.string() + ": " +
                           ec.message());
  }

  fs::path marker = day_folder / INCOMPLETE_MARKER;
  {
    std::ofstream out(marker, std::ios::trunc);
    out << note << "\n";
    out.flush();
    if (!out) {
      throw OffloadError(ErrorKind::TransferError,
                         "Cannot write " + marker.string());
    }
  }
  if (!fsync_path(marker)) {
    throw OffloadError(ErrorKind::TransferError,
                       "Cannot sync " + marker.string());
  }
  fsync_path(day_folder);
}

bool mark_import_complete(const fs::path &day_folder) {
  std::error_code ec;
  fs::remove(day_folder / INCOMPLETE_MARKER, ec);
  if (ec) {
    LOG_WARN("Cannot remove import marker in " + day_folder.string() + ": " +
             ec.message());
    return false;
  }
  fsync_path(day_folder);
  return true;
}

bool is_import_incomplete(const fs::path &day_folder) {
  std::error_code ec;
  return fs::is_regular_file(
      fs::symlink_status(day_folder / INCOMPLETE_MARKER, ec));
}

} // namespace offload
