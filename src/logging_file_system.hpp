#ifndef INCLUDE_GUARD_DB9B0FE2_8BD5_432C_AE8A_4E3AFC5C3A49
#define INCLUDE_GUARD_DB9B0FE2_8BD5_432C_AE8A_4E3AFC5C3A49

#include <llvm/ADT/IntrusiveRefCntPtr.h>
#include <llvm/Support/VirtualFileSystem.h>

#include <iosfwd>

namespace IncludeTree {

/// This component is a `FileSystem` that forwards everything to another
/// `FileSystem` and writes a line to a stream for each `status` and
/// `openFileForRead` call along with whether it succeeded.  It is used to
/// see which paths were tried when resolving include directives.
class LoggingFileSystem : public llvm::vfs::FileSystem {
  llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> m_underlying;
  std::ostream &m_log;

public:
  LoggingFileSystem(llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> underlying,
                    std::ostream &log);

  llvm::ErrorOr<llvm::vfs::Status> status(const llvm::Twine &path) final;
  llvm::ErrorOr<std::unique_ptr<llvm::vfs::File>>
  openFileForRead(const llvm::Twine &path) final;
  llvm::vfs::directory_iterator dir_begin(const llvm::Twine &dir,
                                          std::error_code &ec) final;
  llvm::ErrorOr<std::string> getCurrentWorkingDirectory() const final;
  std::error_code setCurrentWorkingDirectory(const llvm::Twine &path) final;
  std::error_code getRealPath(const llvm::Twine &path,
                              llvm::SmallVectorImpl<char> &output) const final;
  std::error_code isLocal(const llvm::Twine &path, bool &result) final;
};

} // namespace IncludeTree

#endif
