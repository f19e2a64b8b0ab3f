// core/collision.hpp - Day-folder collision detection
#pragma once

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

// Throws OffloadError(CollisionError) if `day_folder` already exists under
// any of the candidate roots as a finished import. Returns the roots proven
// free of it; a root that cannot be inspected is left out so it is never
// routed to. A day-folder still carrying the incomplete-import marker is
// not a collision: only the roots holding one are returned, so the run
// resumes there. Never touches the filesystem beyond stat().
std::vector<fs::path> check_collision(const std::vector<fs::path> &roots,
                                      const fs::path &day_folder);

} // namespace offload
