#ifndef INCLUDE_GUARD_B3B71412_4BBD_4BE8_B351_1FD050574B15
#define INCLUDE_GUARD_B3B71412_4BBD_4BE8_B351_1FD050574B15

#include "graph.hpp"

#include <initializer_list>
#include <iosfwd>
#include <span>
#include <string_view>

namespace IncludeTree {

/// This component prints a `Graph` as an indented tree for each root, e.g.
///
///   /src/main.cpp
///   | [1]: /src/a.h
///   | | [3]: /src/b.h
///   | [2]: /src/b.h (see above)
///   | [4]: missing.h (unresolved)
///
/// Every file that is printed is remembered across all roots.  When a file
/// that has already been printed and has includes of its own is seen again
/// it is printed with "(see above)" instead of being expanded a second time.
/// Files without any includes are always printed in full.
struct print_tree {
  static constexpr std::string_view indent = "| ";

  static void forest(const Graph &graph,
                     std::span<const Graph::vertex_descriptor> roots,
                     std::ostream &out);
  static void forest(const Graph &graph,
                     std::initializer_list<Graph::vertex_descriptor> roots,
                     std::ostream &out);
};

} // namespace IncludeTree

#endif
