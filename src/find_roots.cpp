#include "find_roots.hpp"

#include "search_paths.hpp"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/VirtualFileSystem.h>

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace IncludeTree {

namespace {

const std::pair<std::string_view, find_roots::file_type> lookup[] = {
    {"cpp", find_roots::file_type::source},
    {"c", find_roots::file_type::source},
    {"cc", find_roots::file_type::source},
    {"C", find_roots::file_type::source},
    {"cxx", find_roots::file_type::source},
    {"c++", find_roots::file_type::source},
    {"h", find_roots::file_type::header},
    {"hpp", find_roots::file_type::header},
    {"hh", find_roots::file_type::header},
    {"H", find_roots::file_type::header},
    {"hxx", find_roots::file_type::header},
    {"h++", find_roots::file_type::header},
    {"", find_roots::file_type::ignore},
};

} // namespace

find_roots::file_type find_roots::map_ext(std::string_view file) {
  const auto dot = std::find(file.rbegin(), file.rend(), '.').base();
  if (dot == file.begin()) {
    return file_type::ignore;
  }
  const std::string_view ext(dot, file.end());
  // Use end-1 because if we fail to find then the true last element is 'ignore'
  return std::find_if(std::begin(lookup), std::end(lookup) - 1,
                      [=](auto p) { return p.first == ext; })
      ->second;
}

llvm::Expected<std::vector<std::string>>
find_roots::from_dir(std::string_view dir, llvm::vfs::FileSystem &fs,
                     std::function<file_type(std::string_view)> type) {
  llvm::SmallString<256> absolute(dir);
  if (const std::error_code ec = fs.makeAbsolute(absolute)) {
    return llvm::createStringError(ec, "Cannot make '%s' absolute",
                                   absolute.c_str());
  }
  const std::string directory = normalize_path(absolute);

  std::vector<std::string> sources;
  std::vector<std::string> headers;

  std::error_code ec;
  const llvm::vfs::directory_iterator end;
  for (llvm::vfs::directory_iterator it = fs.dir_begin(directory, ec);
       !ec && it != end; it.increment(ec)) {
    if (it->type() == llvm::sys::fs::file_type::directory_file) {
      continue;
    }

    // Symlinks and entries of unknown type need a `status` to see if they
    // are really files
    if (it->type() != llvm::sys::fs::file_type::regular_file) {
      const llvm::ErrorOr<llvm::vfs::Status> s = fs.status(it->path());
      if (!s || !s->isRegularFile()) {
        continue;
      }
    }

    switch (type(it->path())) {
    case file_type::source:
      sources.push_back(it->path().str());
      break;
    case file_type::header:
      headers.push_back(it->path().str());
      break;
    case file_type::ignore:
      break;
    }
  }

  if (ec) {
    return llvm::createStringError(ec, "Cannot list directory '%s'",
                                   directory.c_str());
  }

  std::sort(sources.begin(), sources.end());
  std::sort(headers.begin(), headers.end());
  sources.insert(sources.end(), std::make_move_iterator(headers.begin()),
                 std::make_move_iterator(headers.end()));
  return sources;
}

} // namespace IncludeTree
