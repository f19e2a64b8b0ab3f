// core/inventory.cpp - Media file inventory implementation
#include "inventory.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <map>

namespace offload {

// "card/" and "card" must yield the same relative paths
static fs::path normalize_root(const fs::path &root) {
  fs::path base = root.lexically_normal();
  if (!base.has_filename() && base.has_parent_path() &&
      base != base.root_path()) {
    base = base.parent_path();
  }
  return base;
}

static void scan_tree(const fs::path &volume, const SourceTree &tree,
                      std::map<std::string, MediaFile> &found) {
  fs::path root = normalize_root(volume);
  fs::path tree_root = root / tree.path;
  std::error_code ec;
  if (!fs::is_directory(tree_root, ec)) {
    LOG_DEBUG("Source tree not present: " + tree_root.string());
    return;
  }

  for (auto it = fs::recursive_directory_iterator(tree_root);
       it != fs::recursive_directory_iterator(); ++it) {
    const auto &entry = *it;
    fs::path rel = entry.path().lexically_relative(root);

    if (is_hidden_or_system(rel)) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }

    if (entry.is_symlink() || !entry.is_regular_file()) {
      continue;
    }

    if (tree.extensions.count(lower_extension(entry.path())) == 0) {
      continue;
    }

    MediaFile file;
    file.relative = rel.generic_string();
    file.absolute = entry.path();
    file.size = entry.file_size();
    file.kind = tree.kind;
    // First registration wins when trees overlap
    found.emplace(file.relative, std::move(file));
  }
}

std::vector<MediaFile> scan_media(const fs::path &root,
                                  const CameraProfile &profile) {
  std::map<std::string, MediaFile> found;
  for (const auto &tree : profile.sources) {
    scan_tree(root, tree, found);
  }

  std::vector<MediaFile> files;
  files.reserve(found.size());
  for (auto &[rel, file] : found) {
    files.push_back(std::move(file));
  }
  return files;
}

std::vector<MediaFile> scan_media_kind(const fs::path &root,
                                       const CameraProfile &profile,
                                       SourceKind kind, size_t limit) {
  std::map<std::string, MediaFile> found;
  for (const auto &tree : profile.sources) {
    if (tree.kind == kind) {
      scan_tree(root, tree, found);
    }
  }

  std::vector<MediaFile> files;
  for (auto &[rel, file] : found) {
    if (files.size() >= limit)
      break;
    files.push_back(std::move(file));
  }
  return files;
}

uint64_t total_bytes(const std::vector<MediaFile> &files) {
  uint64_t total = 0;
  for (const auto &f : files) {
    total += f.size;
  }
  return total;
}

} // namespace offload
