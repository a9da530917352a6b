#include "search_paths.hpp"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/VirtualFileSystem.h>

#include <algorithm>
#include <ostream>
#include <utility>

namespace IncludeTree {

std::string normalize_path(llvm::StringRef path) {
  llvm::SmallString<256> out;
  llvm::sys::path::native(path, out);
  llvm::sys::path::remove_dots(out, /*remove_dot_dot=*/true);
  return out.str().str();
}

search_paths::search_paths(llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs)
    : m_fs(std::move(fs)), m_dirs() {}

bool search_paths::add(llvm::StringRef dir) {
  if (dir.empty()) {
    return false;
  }

  llvm::SmallString<256> absolute(dir);
  if (m_fs->makeAbsolute(absolute)) {
    return false;
  }

  std::string normalized = normalize_path(absolute);
  const llvm::ErrorOr<llvm::vfs::Status> s = m_fs->status(normalized);
  if (!s || !s->isDirectory()) {
    return false;
  }

  if (std::find(m_dirs.begin(), m_dirs.end(), normalized) == m_dirs.end()) {
    m_dirs.push_back(std::move(normalized));
  }
  return true;
}

bool search_paths::is_file(llvm::StringRef path) const {
  const llvm::ErrorOr<llvm::vfs::Status> s = m_fs->status(path);
  return s && s->isRegularFile();
}

search_paths::resolution search_paths::resolve(llvm::StringRef raw) const {
  if (raw.empty()) {
    return {raw.str(), false};
  }

  std::string normalized = normalize_path(raw);
  if (llvm::sys::path::is_absolute(normalized)) {
    const bool found = is_file(normalized);
    return {std::move(normalized), found};
  }

  for (const std::string &dir : m_dirs) {
    llvm::SmallString<256> candidate(dir);
    llvm::sys::path::append(candidate, normalized);
    std::string full = normalize_path(candidate);
    if (is_file(full)) {
      return {std::move(full), true};
    }
  }

  return {raw.str(), false};
}

std::span<const std::string> search_paths::directories() const {
  return m_dirs;
}

bool operator==(const search_paths::resolution &lhs,
                const search_paths::resolution &rhs) {
  return lhs.path == rhs.path && lhs.found == rhs.found;
}

bool operator!=(const search_paths::resolution &lhs,
                const search_paths::resolution &rhs) {
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &out,
                         const search_paths::resolution &value) {
  return out << '[' << value.path << (value.found ? " found" : " not found")
             << ']';
}

} // namespace IncludeTree
