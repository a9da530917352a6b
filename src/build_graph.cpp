#include "build_graph.hpp"

#include "include_scanner.hpp"
#include "search_paths.hpp"

#include <llvm/Support/VirtualFileSystem.h>

#include <algorithm>
#include <utility>

namespace IncludeTree {

namespace {

const Graph::vertex_descriptor empty =
    boost::graph_traits<Graph>::null_vertex();

// A file that we have started, but not finished, scanning.  We keep these
// on an explicit stack instead of recursing so that a long chain of
// includes cannot overflow the call stack.
struct InProgress {
  Graph::vertex_descriptor v;
  include_scanner scanner;
};

} // namespace

graph_builder::graph_builder(const search_paths &paths,
                             llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs,
                             build_graph::options opts)
    : m_r(), m_lookup(), m_search_paths(paths), m_fs(std::move(fs)),
      m_options(std::move(opts)) {}

std::pair<Graph::vertex_descriptor, bool>
graph_builder::add_or_find(const std::string &path, bool exists) {
  auto const [it, inserted] = m_lookup.emplace(path, empty);
  if (inserted) {
    it->second = add_vertex(file_node(path).set_exists(exists), m_r.graph);
  }
  return {it->second, inserted};
}

Graph::vertex_descriptor graph_builder::build_or_get(const std::string &path) {
  if (const std::optional<Graph::vertex_descriptor> v = find(path)) {
    return *v;
  }
  const Graph::vertex_descriptor root =
      add_or_find(path, m_search_paths.is_file(path)).first;

  std::vector<InProgress> stack;
  const auto start = [&](Graph::vertex_descriptor v) {
    const std::string &p = m_r.graph[v].path;
    if (m_options.file_started) {
      m_options.file_started(p);
    }
    stack.push_back({v, include_scanner::from_file(*m_fs, p)});
  };

  if (m_r.graph[root].exists) {
    start(root);
  }

  while (!stack.empty()) {
    const Graph::vertex_descriptor from = stack.back().v;
    const std::optional<include_directive> directive =
        stack.back().scanner.next();
    if (!directive) {
      stack.pop_back();
      continue;
    }

    const search_paths::resolution resolved =
        m_search_paths.resolve(directive->path);
    if (!resolved.found) {
      m_r.missing_includes.insert(directive->path);
    }

    // The vertex is registered before it is scanned so that if we come
    // across it again through a cycle we will find it in `m_lookup`.  An
    // unresolved include is never scanned, even if its raw path happens to
    // name a file relative to the working directory.
    const auto [to, is_new] = add_or_find(resolved.path, resolved.found);

    // Only the first include of a file is kept
    if (!edge(from, to, m_r.graph).second) {
      add_edge(from, to, include_edge{directive->line_number}, m_r.graph);
    }

    if (is_new && m_r.graph[to].exists) {
      start(to);
    }
  }

  return root;
}

std::optional<Graph::vertex_descriptor>
graph_builder::find(llvm::StringRef path) const {
  const auto it = m_lookup.find(path.str());
  if (it == m_lookup.end()) {
    return std::nullopt;
  }
  return it->second;
}

const Graph &graph_builder::graph() const { return m_r.graph; }

const std::set<std::string> &graph_builder::missing_includes() const {
  return m_r.missing_includes;
}

build_graph::result graph_builder::release() && { return std::move(m_r); }

build_graph::result
build_graph::from_roots(std::span<const std::string> roots,
                        const search_paths &paths,
                        llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs,
                        options opts) {
  graph_builder builder(paths, std::move(fs), std::move(opts));
  std::vector<Graph::vertex_descriptor> vertices(roots.size());
  std::transform(
      roots.begin(), roots.end(), vertices.begin(),
      [&](const std::string &root) { return builder.build_or_get(root); });

  result r = std::move(builder).release();
  r.roots = std::move(vertices);
  return r;
}

build_graph::result
build_graph::from_roots(std::initializer_list<std::string> roots,
                        const search_paths &paths,
                        llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs,
                        options opts) {
  return from_roots(std::span(roots.begin(), roots.end()), paths,
                    std::move(fs), std::move(opts));
}

} // namespace IncludeTree
