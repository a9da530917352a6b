#ifndef INCLUDE_GUARD_A3636463_9F6C_441A_81D9_C54DB69593F7
#define INCLUDE_GUARD_A3636463_9F6C_441A_81D9_C54DB69593F7

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/LineIterator.h>
#include <llvm/Support/MemoryBuffer.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace llvm::vfs {
class FileSystem;
}

namespace IncludeTree {

struct include_directive {
  std::string path;     //< Text between the `""` or `<>` delimiters
  unsigned line_number; //< 1-based
};

bool operator==(const include_directive &lhs, const include_directive &rhs);
bool operator!=(const include_directive &lhs, const include_directive &rhs);
std::ostream &operator<<(std::ostream &out, const include_directive &value);

/// This component lazily walks the lines of a file and returns the
/// `#include` directives that it finds.  There is no understanding of
/// comments, conditional compilation or line continuations and each line
/// is matched independently with `match`.
class include_scanner {
  std::unique_ptr<llvm::MemoryBuffer> m_buffer;
  llvm::line_iterator m_it;

public:
  /// Create a scanner that returns no directives.
  include_scanner();

  /// Create a scanner over the contents of `buffer`.
  explicit include_scanner(std::unique_ptr<llvm::MemoryBuffer> buffer);

  include_scanner(include_scanner &&) = default;
  include_scanner &operator=(include_scanner &&) = default;

  /// Create a scanner over the file at `path`.  If the file cannot be read
  /// then the scanner will return no directives.
  static include_scanner from_file(llvm::vfs::FileSystem &fs,
                                   llvm::StringRef path);

  /// Return the next directive, or an empty optional once the whole file
  /// has been scanned.
  std::optional<include_directive> next();

  /// Return the path inside an include directive if `line` contains one.
  /// This looks for `#include` followed by whitespace and then a path
  /// surrounded by `""` or `<>`.  The directive may be anywhere on the
  /// line, so `// #include "a.h"` will return `a.h`.
  static std::optional<llvm::StringRef> match(llvm::StringRef line);
};

} // namespace IncludeTree

#endif
