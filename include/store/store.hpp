#ifndef FTS_STORE_HPP
#define FTS_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "store/exclusive_file.hpp"

namespace fts {
namespace store {

// Flat directory of stored files. Keys are plain file names; every path the
// store touches is a direct child of the root.
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws StoreError if the root is not an existing directory
  explicit Store(const std::filesystem::path& base_path);


  // ---- KEY HANDLING ----
  // Reduces a client supplied name to its last path component
  static std::string sanitize(const std::string& file_name);
  // True for names that denote a file directly inside the root
  static bool is_valid_key(const std::string& key);


  // ---- CORE STORAGE OPERATIONS ----
  // Creates a new file for writing, fails if the key already exists
  std::unique_ptr<ExclusiveFile> create_exclusive(const std::string& key) const;
  // Opens a stored file for reading in binary mode
  std::ifstream open_for_read(const std::string& key) const;
  // Removes a stored file. Failures are logged, cleanup paths carry on.
  void remove(const std::string& key) const;


  // ---- QUERY OPERATIONS ----
  // Checks if anything exists under the given key
  bool has(const std::string& key) const;
  // Size of the stored regular file, empty if missing or not a regular file
  std::optional<std::uintmax_t> get_file_size(const std::string& key) const;
  // Bytes available to an unprivileged writer on the root's filesystem
  std::uintmax_t available_space() const;

  const std::filesystem::path& get_base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;

  // Resolves a key to its path under the root, throws StoreError for invalid keys
  std::filesystem::path resolve_key_path(const std::string& key) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace fts

#endif // FTS_STORE_HPP
