#ifndef INCLUDE_GUARD_8D48B5F0_5CAC_4F70_9AE0_850E89AE8EA9
#define INCLUDE_GUARD_8D48B5F0_5CAC_4F70_9AE0_850E89AE8EA9

#include <llvm/Support/Error.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace llvm::vfs {
class FileSystem;
}

namespace IncludeTree {

struct find_roots {
  enum class file_type {
    source,
    header,
    ignore,
  };

  // Return the type of `file` based on its extension.
  static file_type map_ext(std::string_view file);

  // Return all regular files directly inside `dir` (subdirectories are not
  // searched) that `type` classifies as a source, sorted by path, followed
  // by all headers, sorted by path.  `dir` is made absolute against the
  // working directory of `fs`.  Return an error if `dir` cannot be listed.
  static llvm::Expected<std::vector<std::string>>
  from_dir(std::string_view dir, llvm::vfs::FileSystem &fs,
           std::function<file_type(std::string_view)> type = map_ext);
};

} // namespace IncludeTree

#endif
