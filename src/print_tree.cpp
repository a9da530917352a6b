#include "print_tree.hpp"

#include <termcolor/termcolor.hpp>

#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace IncludeTree {

namespace {

#define see_above_color termcolor::bright_blue
#define unresolved_color termcolor::bright_red

struct EdgeCursor {
  Graph::out_edge_iterator it;
  Graph::out_edge_iterator end;
  std::size_t depth;
};

void write_indent(std::ostream &out, std::size_t depth) {
  for (std::size_t i = 0; i < depth; ++i) {
    out << print_tree::indent;
  }
}

} // namespace

void print_tree::forest(const Graph &graph,
                        std::span<const Graph::vertex_descriptor> roots,
                        std::ostream &out) {
  // Shared across all roots so that a file is only expanded once in the
  // whole output
  std::unordered_set<std::string> visited;
  std::vector<EdgeCursor> stack;

  for (const Graph::vertex_descriptor root : roots) {
    out << graph[root].path << '\n';
    visited.insert(graph[root].path);

    const auto [begin, end] = out_edges(root, graph);
    stack.push_back({begin, end, 1u});
    while (!stack.empty()) {
      EdgeCursor &cursor = stack.back();
      if (cursor.it == cursor.end) {
        stack.pop_back();
        continue;
      }

      const Graph::edge_descriptor e = *cursor.it++;
      const std::size_t depth = cursor.depth;
      const Graph::vertex_descriptor v = target(e, graph);
      const file_node &child = graph[v];

      write_indent(out, depth);
      out << '[' << graph[e].line_number << "]: " << child.path;

      // Leaves are cheap so we print them again, but anything with children
      // has already been expanded and would only repeat (or loop forever).
      if (visited.contains(child.path) && out_degree(v, graph) > 0) {
        out << see_above_color << " (see above)" << termcolor::reset << '\n';
        continue;
      }

      visited.insert(child.path);
      if (!child.exists) {
        out << unresolved_color << " (unresolved)" << termcolor::reset << '\n';
        continue;
      }

      out << '\n';
      const auto [child_begin, child_end] = out_edges(v, graph);
      stack.push_back({child_begin, child_end, depth + 1});
    }
  }
}

void print_tree::forest(const Graph &graph,
                        std::initializer_list<Graph::vertex_descriptor> roots,
                        std::ostream &out) {
  forest(graph, std::span(roots.begin(), roots.end()), out);
}

} // namespace IncludeTree
