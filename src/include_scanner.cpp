#include "include_scanner.hpp"

#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/Regex.h>
#include <llvm/Support/VirtualFileSystem.h>

#include <ostream>
#include <utility>

namespace IncludeTree {

namespace {

const llvm::Regex &include_regex() {
  // POSIX extended syntax as `llvm::Regex` has no `\s`
  static const llvm::Regex regex(
      "[[:space:]]*#include[[:space:]]+[\"<]([^\"<>]+)[\">]");
  return regex;
}

} // namespace

bool operator==(const include_directive &lhs, const include_directive &rhs) {
  return lhs.path == rhs.path && lhs.line_number == rhs.line_number;
}

bool operator!=(const include_directive &lhs, const include_directive &rhs) {
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &out, const include_directive &value) {
  return out << '[' << value.path << '#' << value.line_number << ']';
}

include_scanner::include_scanner() : m_buffer(), m_it() {}

include_scanner::include_scanner(std::unique_ptr<llvm::MemoryBuffer> buffer)
    : m_buffer(std::move(buffer)),
      m_it(*m_buffer, /*SkipBlanks=*/false) {}

include_scanner include_scanner::from_file(llvm::vfs::FileSystem &fs,
                                           llvm::StringRef path) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
      fs.getBufferForFile(path);
  if (!buffer) {
    return include_scanner();
  }
  return include_scanner(std::move(buffer.get()));
}

std::optional<include_directive> include_scanner::next() {
  while (!m_it.is_at_eof()) {
    const llvm::StringRef line = *m_it;
    const unsigned line_number = static_cast<unsigned>(m_it.line_number());
    ++m_it;
    if (const std::optional<llvm::StringRef> path = match(line)) {
      return include_directive{path->str(), line_number};
    }
  }
  return std::nullopt;
}

std::optional<llvm::StringRef> include_scanner::match(llvm::StringRef line) {
  llvm::SmallVector<llvm::StringRef, 2> matches;
  if (!include_regex().match(line, &matches)) {
    return std::nullopt;
  }
  return matches[1];
}

} // namespace IncludeTree
