#ifndef INCLUDE_GUARD_E8007E31_D6DB_4418_94BC_C83B38A03970
#define INCLUDE_GUARD_E8007E31_D6DB_4418_94BC_C83B38A03970

#include <llvm/ADT/IntrusiveRefCntPtr.h>
#include <llvm/ADT/StringRef.h>

#include <iosfwd>
#include <span>
#include <string>
#include <vector>

namespace llvm::vfs {
class FileSystem;
}

namespace IncludeTree {

/// This component holds the ordered list of directories that are searched
/// when resolving the path written in an include directive.  Directories
/// are searched in the order in which they were added, so the first
/// directory that contains a matching file wins.
class search_paths {
  llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> m_fs;
  std::vector<std::string> m_dirs;

public:
  struct resolution {
    std::string path; //< The file found, otherwise the raw path passed in
    bool found = false;
  };

  /// Create an empty `search_paths` that uses `fs` for all file queries.
  explicit search_paths(llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs);

  /// Append `dir` to the end of the search order.  A relative `dir` is made
  /// absolute against the working directory of the file system.  Return
  /// `false` and do nothing if `dir` is empty or is not an existing
  /// directory.  Adding a directory a second time returns `true` but
  /// does not change the search order.
  bool add(llvm::StringRef dir);

  /// Return the file that the include directive text `raw` refers to.  An
  /// absolute `raw` is returned (normalized) whether or not it exists.  A
  /// relative `raw` is appended to each directory in turn and the first
  /// existing file is returned.  If nothing is found then `found` is
  /// `false` and `path` is `raw` unchanged.
  resolution resolve(llvm::StringRef raw) const;

  /// Return whether `path` refers to a regular file.
  bool is_file(llvm::StringRef path) const;

  std::span<const std::string> directories() const;
};

/// Return `path` with native separators and without any `.` or `..`
/// components.  This is purely lexical.
std::string normalize_path(llvm::StringRef path);

bool operator==(const search_paths::resolution &lhs,
                const search_paths::resolution &rhs);
bool operator!=(const search_paths::resolution &lhs,
                const search_paths::resolution &rhs);
std::ostream &operator<<(std::ostream &out,
                         const search_paths::resolution &value);

} // namespace IncludeTree

#endif
