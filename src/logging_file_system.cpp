#include "logging_file_system.hpp"

#include <ostream>
#include <utility>

namespace IncludeTree {

namespace {

std::ostream &write_outcome(std::ostream &out, std::error_code ec) {
  if (ec) {
    return out << "error (" << ec.message() << ')';
  }
  return out << "ok";
}

} // namespace

LoggingFileSystem::LoggingFileSystem(
    llvm::IntrusiveRefCntPtr<llvm::vfs::FileSystem> underlying,
    std::ostream &log)
    : m_underlying(std::move(underlying)), m_log(log) {}

llvm::ErrorOr<llvm::vfs::Status>
LoggingFileSystem::status(const llvm::Twine &path) {
  llvm::ErrorOr<llvm::vfs::Status> s = m_underlying->status(path);
  m_log << "status(" << path.str() << ") = ";
  write_outcome(m_log, s.getError()) << '\n';
  return s;
}

llvm::ErrorOr<std::unique_ptr<llvm::vfs::File>>
LoggingFileSystem::openFileForRead(const llvm::Twine &path) {
  llvm::ErrorOr<std::unique_ptr<llvm::vfs::File>> f =
      m_underlying->openFileForRead(path);
  m_log << "openFileForRead(" << path.str() << ") = ";
  write_outcome(m_log, f.getError()) << '\n';
  return f;
}

llvm::vfs::directory_iterator
LoggingFileSystem::dir_begin(const llvm::Twine &dir, std::error_code &ec) {
  llvm::vfs::directory_iterator it = m_underlying->dir_begin(dir, ec);
  m_log << "dir_begin(" << dir.str() << ") = ";
  write_outcome(m_log, ec) << '\n';
  return it;
}

llvm::ErrorOr<std::string>
LoggingFileSystem::getCurrentWorkingDirectory() const {
  return m_underlying->getCurrentWorkingDirectory();
}

std::error_code
LoggingFileSystem::setCurrentWorkingDirectory(const llvm::Twine &path) {
  return m_underlying->setCurrentWorkingDirectory(path);
}

std::error_code
LoggingFileSystem::getRealPath(const llvm::Twine &path,
                               llvm::SmallVectorImpl<char> &output) const {
  return m_underlying->getRealPath(path, output);
}

std::error_code LoggingFileSystem::isLocal(const llvm::Twine &path,
                                           bool &result) {
  return m_underlying->isLocal(path, result);
}

} // namespace IncludeTree
