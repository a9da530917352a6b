#ifndef INCLUDE_GUARD_64C2E922_0FDF_4A84_8BEE_FD3C6B009602
#define INCLUDE_GUARD_64C2E922_0FDF_4A84_8BEE_FD3C6B009602

#include <boost/graph/adjacency_list.hpp>

#include <iosfwd>
#include <string>

namespace IncludeTree {

class file_node;
class include_edge;

// Out edges are stored in a `vecS` so that they are kept in the order in
// which they were added, i.e. the order of the `#include` lines.
using Graph =
    boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS,
                          file_node, include_edge>;

class file_node {
public:
  std::string path; //< The resolved path of the file, or the raw text
                    //< of the include directive if it could not be
                    //< resolved.  This is the identity of the node.
  bool exists = false; //< Whether `path` was a regular file when we
                       //< first saw it

  file_node();
  file_node(const std::string &path);

  file_node &set_exists(bool exists) &;
  file_node &&set_exists(bool exists) &&;
};

std::ostream &operator<<(std::ostream &stream, const file_node &value);
bool operator==(const file_node &lhs, const file_node &rhs);
bool operator!=(const file_node &lhs, const file_node &rhs);

class include_edge {
public:
  unsigned line_number = 0; //< 1-based line of the directive
};

std::ostream &operator<<(std::ostream &stream, const include_edge &value);
bool operator==(const include_edge &lhs, const include_edge &rhs);
bool operator!=(const include_edge &lhs, const include_edge &rhs);

} // namespace IncludeTree

#endif
