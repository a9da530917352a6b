#include "print_tree.hpp"

#include "build_graph.hpp"
#include "search_paths.hpp"
#include "test_fixtures.hpp"

#include <gmock/gmock-matchers.h>
#include <gmock/gmock-more-matchers.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <span>
#include <sstream>
#include <string>

using namespace IncludeTree;
using namespace testing;

namespace {

std::string print(const Graph &graph,
                  std::span<const Graph::vertex_descriptor> roots) {
  std::ostringstream out;
  print_tree::forest(graph, roots, out);
  return out.str();
}

TEST_F(DiamondGraph, SharedFileIsExpandedOnce) {
  EXPECT_THAT(print(graph, roots()), Eq("a\n"
                                        "| [1]: b\n"
                                        "| | [3]: d\n"
                                        "| | | [5]: e\n"
                                        "| [2]: c\n"
                                        "| | [4]: d (see above)\n"));
}

TEST_F(DiamondGraph, EveryRootIsPrinted) {
  std::ostringstream out;
  print_tree::forest(graph, {b, c}, out);
  EXPECT_THAT(out.str(), Eq("b\n"
                            "| [3]: d\n"
                            "| | [5]: e\n"
                            "c\n"
                            "| [4]: d (see above)\n"));
}

TEST_F(DiamondGraph, RootAlreadyPrinted) {
  std::ostringstream out;
  print_tree::forest(graph, {d, a}, out);
  EXPECT_THAT(out.str(), Eq("d\n"
                            "| [5]: e\n"
                            "a\n"
                            "| [1]: b\n"
                            "| | [3]: d (see above)\n"
                            "| [2]: c\n"
                            "| | [4]: d (see above)\n"));
}

TEST_F(DiamondGraph, NoRoots) {
  EXPECT_THAT(print(graph, {}), IsEmpty());
}

TEST_F(CycleGraph, CycleIsCut) {
  EXPECT_THAT(print(graph, roots()), Eq("a\n"
                                        "| [1]: b\n"
                                        "| | [2]: a (see above)\n"
                                        "| [3]: c (unresolved)\n"
                                        "b\n"
                                        "| [2]: a (see above)\n"));
}

TEST(PrintTree, LeavesAreRepeated) {
  Graph g;
  const Graph::vertex_descriptor a =
      add_vertex(file_node("a").set_exists(true), g);
  const Graph::vertex_descriptor b =
      add_vertex(file_node("b").set_exists(true), g);
  const Graph::vertex_descriptor c =
      add_vertex(file_node("c").set_exists(true), g);
  const Graph::vertex_descriptor leaf =
      add_vertex(file_node("leaf").set_exists(true), g);
  const Graph::vertex_descriptor missing = add_vertex(file_node("missing"), g);
  add_edge(a, b, {1}, g);
  add_edge(a, c, {2}, g);
  add_edge(b, leaf, {10}, g);
  add_edge(b, missing, {11}, g);
  add_edge(c, leaf, {20}, g);
  add_edge(c, missing, {21}, g);

  std::ostringstream out;
  print_tree::forest(g, {a}, out);
  EXPECT_THAT(out.str(), Eq("a\n"
                            "| [1]: b\n"
                            "| | [10]: leaf\n"
                            "| | [11]: missing (unresolved)\n"
                            "| [2]: c\n"
                            "| | [20]: leaf\n"
                            "| | [21]: missing (unresolved)\n"));
}

TEST(PrintTree, SelfInclude) {
  Graph g;
  const Graph::vertex_descriptor a =
      add_vertex(file_node("a").set_exists(true), g);
  add_edge(a, a, {7}, g);

  std::ostringstream out;
  print_tree::forest(g, {a}, out);
  EXPECT_THAT(out.str(), Eq("a\n"
                            "| [7]: a (see above)\n"));
}

TEST(PrintTree, DeepChain) {
  const std::size_t length = 20000;
  Graph g;
  Graph::vertex_descriptor previous =
      add_vertex(file_node("0").set_exists(true), g);
  const Graph::vertex_descriptor first = previous;
  for (std::size_t i = 1; i < length; ++i) {
    const Graph::vertex_descriptor next =
        add_vertex(file_node(std::to_string(i)).set_exists(true), g);
    add_edge(previous, next, {1}, g);
    previous = next;
  }

  std::ostringstream out;
  print_tree::forest(g, {first}, out);
  const std::string s = out.str();
  EXPECT_THAT(std::count(s.begin(), s.end(), '\n'),
              Eq(static_cast<std::ptrdiff_t>(length)));
  EXPECT_THAT(s, EndsWith("| [1]: " + std::to_string(length - 1) + "\n"));
}

// Scanning files and printing them together
TEST(PrintTree, FromFiles) {
  auto fs = make_file_system({
      {"/work/main.cpp", "#include \"a.h\"\n"
                         "#include <missing.h>\n"},
      {"/work/a.h", "#pragma once\n"
                    "#include \"b.h\"\n"},
      {"/work/b.h", "#include \"a.h\"\n"},
  });
  search_paths paths(fs);
  ASSERT_TRUE(paths.add(working_dir));
  const build_graph::result r =
      build_graph::from_roots({"/work/main.cpp", "/work/b.h"}, paths, fs);

  std::ostringstream out;
  print_tree::forest(r.graph, r.roots, out);
  EXPECT_THAT(out.str(), Eq("/work/main.cpp\n"
                            "| [1]: /work/a.h\n"
                            "| | [2]: /work/b.h\n"
                            "| | | [1]: /work/a.h (see above)\n"
                            "| [2]: missing.h (unresolved)\n"
                            "/work/b.h\n"
                            "| [1]: /work/a.h (see above)\n"));
}

TEST(PrintTree, UnresolvedIncludesAreNotExpanded) {
  auto fs = make_file_system({
      {"/src/main.cpp", "#include \"local.h\"\n"
                        "#include \"/nowhere/abs.h\"\n"},
      {"/work/local.h", "#include \"other.h\"\n"},
      {"/work/other.h", ""},
  });
  search_paths paths(fs);
  ASSERT_TRUE(paths.add("/src"));
  const build_graph::result r =
      build_graph::from_roots({"/src/main.cpp"}, paths, fs);

  std::ostringstream out;
  print_tree::forest(r.graph, r.roots, out);
  EXPECT_THAT(out.str(), Eq("/src/main.cpp\n"
                            "| [1]: local.h (unresolved)\n"
                            "| [2]: /nowhere/abs.h (unresolved)\n"));
}

} // namespace
