#include "store/exclusive_file.hpp"
#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace fts {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ExclusiveFile::ExclusiveFile(int fd, const std::filesystem::path& path)
  : fd_(fd)
  , path_(path) {
}

std::unique_ptr<ExclusiveFile> ExclusiveFile::create(const std::filesystem::path& path) {
  int fd;
  do {
    fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0666);
  } while (fd < 0 && errno == EINTR);

  if (fd < 0) {
    int error = errno;
    std::string reason = "open " + path.filename().string() + ": " + std::generic_category().message(error);
    BOOST_LOG_TRIVIAL(error) << "Exclusive file: Failed to create " << path.string() << ": " << reason;
    throw StoreError(reason);
  }

  BOOST_LOG_TRIVIAL(debug) << "Exclusive file: Created " << path.string();
  return std::unique_ptr<ExclusiveFile>(new ExclusiveFile(fd, path));
}

ExclusiveFile::~ExclusiveFile() {
  if (fd_ >= 0 && !close()) {
    BOOST_LOG_TRIVIAL(warning) << "Exclusive file: Close on destruction failed for " << path_.string();
  }
}


//==============================================
// FILE OPERATIONS
//==============================================

bool ExclusiveFile::write(const char* data, std::size_t size) {
  if (fd_ < 0) {
    BOOST_LOG_TRIVIAL(error) << "Exclusive file: Write to closed file " << path_.string();
    return false;
  }

  std::size_t total_written = 0;
  while (total_written < size) {
    ssize_t written = ::write(fd_, data + total_written, size - total_written);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      BOOST_LOG_TRIVIAL(error) << "Exclusive file: Write to " << path_.string() << " failed: "
                               << std::generic_category().message(errno);
      return false;
    }
    total_written += static_cast<std::size_t>(written);
  }
  return true;
}

bool ExclusiveFile::close() {
  if (fd_ < 0) {
    return true;
  }

  int result = ::close(fd_);
  fd_ = -1;
  if (result != 0) {
    BOOST_LOG_TRIVIAL(error) << "Exclusive file: Close of " << path_.string() << " failed: "
                             << std::generic_category().message(errno);
    return false;
  }
  return true;
}

} // namespace store
} // namespace fts
