#include "includetree.hpp"

#include <iostream>

int main(int argc, const char **argv) {
  return IncludeTree::run(argc, argv, std::cout, std::cerr);
}
