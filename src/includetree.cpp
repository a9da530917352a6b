#include "includetree.hpp"

#include "build_graph.hpp"
#include "find_roots.hpp"
#include "logging_file_system.hpp"
#include "print_tree.hpp"
#include "search_paths.hpp"

#include <termcolor/termcolor.hpp>

#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/Process.h>
#include <llvm/Support/Program.h>
#include <llvm/Support/VirtualFileSystem.h>
#include <llvm/Support/raw_os_ostream.h>

#include <ostream>
#include <string>
#include <vector>

namespace IncludeTree {

int run(int argc, const char **argv, std::ostream &out, std::ostream &err) {
  llvm::cl::OptionCategory search_category("Search Options");

  llvm::cl::list<std::string> include_dirs(
      "I", llvm::cl::desc("Additional include directories"),
      llvm::cl::value_desc("directory"), llvm::cl::Prefix,
      llvm::cl::ZeroOrMore, llvm::cl::cat(search_category));

  llvm::cl::opt<std::string> source_dir(
      "dir",
      llvm::cl::desc("Print the include tree of all C/C++ source and header "
                     "files directly inside this directory.  It is also the "
                     "first include directory searched"),
      llvm::cl::value_desc("directory"), llvm::cl::init("."),
      llvm::cl::cat(search_category));

  llvm::cl::opt<std::string> include_env(
      "include-env",
      llvm::cl::desc("Environment variable containing a list of additional "
                     "include directories searched before any -I "
                     "directories.  Set to empty to disable"),
      llvm::cl::value_desc("name"), llvm::cl::init("INCLUDE"),
      llvm::cl::cat(search_category));

  llvm::cl::OptionCategory output_category("Output Options");

  llvm::cl::opt<bool> verbose(
      "verbose",
      llvm::cl::desc("Whether to log all file system access and unresolved "
                     "includes to stderr"),
      llvm::cl::value_desc("enabled"), llvm::cl::init(false),
      llvm::cl::cat(output_category));

  {
    llvm::raw_os_ostream errors(err);
    // Stop initializing if command-line option parsing failed.
    if (!llvm::cl::ParseCommandLineOptions(
            argc, argv,
            "Print the tree of #include directives for C/C++ files\n",
            &errors)) {
      return 1;
    }
  }

  llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> fs =
      llvm::vfs::getRealFileSystem();
  if (verbose.getValue()) {
    fs = llvm::makeIntrusiveRefCnt<LoggingFileSystem>(fs, err);
  }

  search_paths paths(fs);
  const auto add_search_path = [&](llvm::StringRef dir) {
    if (!paths.add(dir)) {
      err << "Couldn't add include directory '" << dir.str() << "'\n";
    }
  };

  add_search_path(source_dir.getValue());

  if (!include_env.empty()) {
    if (const auto env = llvm::sys::Process::GetEnv(include_env.getValue())) {
      llvm::SmallVector<llvm::StringRef, 8> entries;
      llvm::StringRef(*env).split(entries, llvm::sys::EnvPathSeparator,
                                  /*MaxSplit=*/-1, /*KeepEmpty=*/false);
      for (const llvm::StringRef entry : entries) {
        add_search_path(entry);
      }
    }
  }

  for (const std::string &dir : include_dirs) {
    add_search_path(dir);
  }

  out << "Finding source files...\n";
  llvm::Expected<std::vector<std::string>> roots =
      find_roots::from_dir(source_dir.getValue(), *fs);
  if (!roots) {
    err << llvm::toString(roots.takeError()) << '\n';
    return 1;
  }
  out << roots->size() << " files found.\n";

  build_graph::options options;
  if (verbose.getValue()) {
    options.on_file_started(
        [&](const std::string &file) { err << "scanning " << file << '\n'; });
  }

  const build_graph::result result =
      build_graph::from_roots(*roots, paths, fs, options);

  if (verbose.getValue()) {
    for (const std::string &missing : result.missing_includes) {
      err << "unresolved include '" << missing << "'\n";
    }
  }

  print_tree::forest(result.graph, result.roots, out);

  out << termcolor::reset;
  return 0;
}

} // namespace IncludeTree
