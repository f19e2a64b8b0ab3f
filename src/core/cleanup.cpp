// core/cleanup.cpp - Source cleanup implementation
#include "cleanup.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace offload {

static std::string file_safe(const std::string &s) {
  std::string out;
  for (char c : s) {
    unsigned char uc = static_cast<unsigned char>(c);
    out += (std::isalnum(uc) || c == '-' || c == '.') ? c : '_';
  }
  return out;
}

fs::path audit_path_for(const CleanupRequest &request) {
  if (request.audit_dir.empty()) {
    return request.day_folder / AUDIT_FILE_NAME;
  }
  std::string name = file_safe(request.profile->name) + "_" +
                     file_safe(request.day_folder.filename().string()) + "_" +
                     file_safe(request.run_started) + ".json";
  return request.audit_dir / name;
}

static std::string audit_json(const CleanupRequest &request) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"run_started\": \"" << json_escape(request.run_started)
      << "\",\n";
  out << "  \"written_at\": \"" << json_escape(timestamp_now()) << "\",\n";
  out << "  \"profile\": \"" << json_escape(request.profile->name) << "\",\n";
  out << "  \"source\": \"" << json_escape(request.source_root.string())
      << "\",\n";
  out << "  \"day_folder\": \"" << json_escape(request.day_folder.string())
      << "\",\n";
  out << "  \"files\": [";
  const auto &results = request.report->results;
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &r = results[i];
    out << "\n    {\"path\": \"" << json_escape(r.relative)
        << "\", \"size\": " << r.source_size << ", \"sha256\": \""
        << r.source_digest << "\"}";
    if (i < results.size() - 1)
      out << ",";
  }
  out << (results.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

// Durable before anything is deleted: tmp file, fsync, rename
static bool write_audit(const fs::path &path, const std::string &content) {
  if (!ensure_dir_exists(path.parent_path())) {
    return false;
  }

  fs::path tmp = path;
  tmp += PART_SUFFIX;
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file.is_open()) {
      LOG_WARN("Cannot write audit record " + tmp.string());
      return false;
    }
    file << content;
    file.flush();
    if (!file) {
      LOG_WARN("Short write on audit record " + tmp.string());
      return false;
    }
  }

  std::error_code ec;
  if (!fsync_path(tmp)) {
    fs::remove(tmp, ec);
    return false;
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    LOG_WARN("Cannot place audit record " + path.string() + ": " +
             ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  fsync_path(path.parent_path());
  return true;
}

CleanupResult cleanup_source(const CleanupRequest &request) {
  if (!request.report || !request.report->passed || !request.profile) {
    throw std::logic_error("cleanup requires a passing verification report");
  }

  CleanupResult result;
  std::string content = audit_json(request);

  fs::path primary = audit_path_for(request);
  fs::path fallback = request.day_folder / AUDIT_FILE_NAME;
  if (write_audit(primary, content)) {
    result.audit_path = primary;
  } else if (primary != fallback && write_audit(fallback, content)) {
    LOG_WARN("Audit directory unusable, audit kept in day-folder");
    result.audit_path = fallback;
  } else {
    result.failures.push_back("audit record could not be written, nothing "
                              "deleted");
    LOG_ERROR("Audit record could not be written, source left intact");
    return result;
  }
  LOG_INFO("Audit record written to " + result.audit_path.string());

  for (const auto &r : request.report->results) {
    fs::path target = request.source_root / fs::path(r.relative);
    std::error_code ec;
    if (fs::remove(target, ec) && !ec) {
      result.deleted++;
      continue;
    }
    std::string reason = ec ? ec.message() : "already gone";
    LOG_WARN("Cannot delete " + target.string() + ": " + reason);
    result.failures.push_back(r.relative + ": " + reason);
  }

  for (const auto &tree : request.profile->sources) {
    remove_empty_dirs(request.source_root / tree.path);
  }

  LOG_INFO("Cleanup deleted " + std::to_string(result.deleted) + " of " +
           std::to_string(request.report->results.size()) + " source files");
  return result;
}

} // namespace offload
