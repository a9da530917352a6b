#ifndef INCLUDE_GUARD_8BEC22CE_D78C_49F9_84F2_CCBD78C91088
#define INCLUDE_GUARD_8BEC22CE_D78C_49F9_84F2_CCBD78C91088

#include "graph.hpp"

#include <llvm/ADT/IntrusiveRefCntPtr.h>
#include <llvm/ADT/StringRef.h>

#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace llvm::vfs {
class FileSystem;
}

namespace IncludeTree {

class search_paths;

struct build_graph {
  struct result {
    Graph graph;
    std::vector<Graph::vertex_descriptor> roots;
    std::set<std::string> missing_includes; //< Include directives that
                                            //< could not be resolved
  };

  struct options {
    std::function<void(const std::string &)> file_started;

    options() = default;

    options &on_file_started(std::function<void(const std::string &)> f) {
      file_started = std::move(f);
      return *this;
    }
  };

  // Return the `Graph` of all files reachable from `roots` by following
  // `#include` directives.  Include directives are resolved with `paths`
  // and all files are read through `fs`.  `result::roots` holds the vertex
  // of each entry in `roots`, in the same order.
  static result from_roots(std::span<const std::string> roots,
                           const search_paths &paths,
                           llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs,
                           options opts = options());
  static result from_roots(std::initializer_list<std::string> roots,
                           const search_paths &paths,
                           llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs,
                           options opts = options());
};

/// This component incrementally builds up a `Graph` where each file is
/// represented by exactly one vertex, keyed by its path.  A file is scanned
/// for include directives the first time it is seen and never again, which
/// is what stops include cycles from looping forever.
class graph_builder {
  build_graph::result m_r;
  std::unordered_map<std::string, Graph::vertex_descriptor> m_lookup;
  const search_paths &m_search_paths;
  llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> m_fs;
  build_graph::options m_options;

  // Return the vertex for `path` and whether it was just created.  A new
  // vertex is marked as existing according to `exists`.
  std::pair<Graph::vertex_descriptor, bool>
  add_or_find(const std::string &path, bool exists);

public:
  graph_builder(const search_paths &paths,
                llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs,
                build_graph::options opts = build_graph::options());

  /// Return the vertex for `path`, creating it and everything it
  /// transitively includes if this is the first time `path` is seen.
  /// If `path` is not an existing file then the vertex has no children.
  Graph::vertex_descriptor build_or_get(const std::string &path);

  /// Return the vertex for `path` if it has already been added.
  std::optional<Graph::vertex_descriptor> find(llvm::StringRef path) const;

  const Graph &graph() const;
  const std::set<std::string> &missing_includes() const;

  /// Move out the graph built so far.  `result::roots` is left empty.
  build_graph::result release() &&;
};

} // namespace IncludeTree

#endif
