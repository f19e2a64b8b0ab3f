// core/collision.cpp - Day-folder collision detection implementation
#include "collision.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include "executor.hpp"

namespace offload {

static bool is_absent(const std::error_code &ec) {
  return ec == std::errc::no_such_file_or_directory ||
         ec == std::errc::not_a_directory;
}

std::vector<fs::path> check_collision(const std::vector<fs::path> &roots,
                                      const fs::path &day_folder) {
  std::vector<fs::path> cleared;
  std::vector<fs::path> resumable;
  for (const auto &root : roots) {
    if (root.empty())
      continue;

    fs::path target = root / day_folder;
    std::error_code ec;
    auto status = fs::symlink_status(target, ec);
    if (ec && !is_absent(ec)) {
      LOG_WARN("Cannot inspect " + target.string() + " (" + ec.message() +
               "), root excluded from routing");
      continue;
    }
    if (fs::is_directory(status) && is_import_incomplete(target)) {
      LOG_INFO("Unfinished import at " + target.string() + ", resuming it");
      resumable.push_back(root);
      continue;
    }
    if (fs::exists(status)) {
      LOG_ERROR("Destination path already exists: " + target.string());
      throw OffloadError(ErrorKind::CollisionError,
                         "Destination already exists: " + target.string(),
                         "Camera file counters recycle, so an existing "
                         "day-folder is never merged into.");
    }
    LOG_DEBUG("No collision at " + target.string());
    cleared.push_back(root);
  }
  // An unfinished import is completed where it started
  return resumable.empty() ? cleared : resumable;
}

} // namespace offload
