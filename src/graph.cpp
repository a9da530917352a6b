#include "graph.hpp"

#include <ostream>
#include <utility>

namespace IncludeTree {

file_node::file_node() = default;

file_node::file_node(const std::string &path) : path(path) {}

file_node &file_node::set_exists(bool v) & {
  exists = v;
  return *this;
}

file_node &&file_node::set_exists(bool v) && {
  exists = v;
  return std::move(*this);
}

std::ostream &operator<<(std::ostream &stream, const file_node &value) {
  return stream << value.path << (value.exists ? "" : " [missing]");
}

bool operator==(const file_node &lhs, const file_node &rhs) {
  return lhs.path == rhs.path && lhs.exists == rhs.exists;
}

bool operator!=(const file_node &lhs, const file_node &rhs) {
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &stream, const include_edge &value) {
  return stream << '#' << value.line_number;
}

bool operator==(const include_edge &lhs, const include_edge &rhs) {
  return lhs.line_number == rhs.line_number;
}

bool operator!=(const include_edge &lhs, const include_edge &rhs) {
  return !(lhs == rhs);
}

} // namespace IncludeTree
