#ifndef FTS_STORE_EXCLUSIVE_FILE_HPP
#define FTS_STORE_EXCLUSIVE_FILE_HPP

#include <cstddef>
#include <filesystem>
#include <memory>

namespace fts {
namespace store {

// Write handle to a file this process created with O_CREAT | O_EXCL.
// The descriptor is closed when the handle is destroyed.
class ExclusiveFile {
public:
  ExclusiveFile(const ExclusiveFile&) = delete;
  ExclusiveFile& operator=(const ExclusiveFile&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the file, throws StoreError carrying the OS error text if it
  // already exists or cannot be created
  static std::unique_ptr<ExclusiveFile> create(const std::filesystem::path& path);
  ~ExclusiveFile();


  // ---- FILE OPERATIONS ----
  // Writes all bytes, returns false on the first failed write
  bool write(const char* data, std::size_t size);
  // Closes the descriptor, returns false if the close reported an error
  bool close();


  // ---- GETTERS ----
  bool is_open() const { return fd_ >= 0; }

private:
  ExclusiveFile(int fd, const std::filesystem::path& path);

  // ---- PARAMETERS ----
  int fd_;
  std::filesystem::path path_;
};

} // namespace store
} // namespace fts

#endif // FTS_STORE_EXCLUSIVE_FILE_HPP
