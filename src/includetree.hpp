#ifndef INCLUDE_GUARD_2F5FD9DE_73C2_4938_BB3A_8FC6A1C5B620
#define INCLUDE_GUARD_2F5FD9DE_73C2_4938_BB3A_8FC6A1C5B620

#include <iosfwd>

namespace IncludeTree {

// Run `includetree` with the array of command line options specified
// by the array `argv` of length `argc`.  Output the results to `out` and
// any errors to `err`.  Return 0 on success and non-zero on error.
int run(int argc, const char **argv, std::ostream &out, std::ostream &err);

} // namespace IncludeTree

#endif
