#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace fts {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path, which must already exist
Store::Store(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path_.string();

  std::error_code ec;
  if (!std::filesystem::is_directory(base_path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Base path is not a directory: " << base_path_.string();
    throw StoreError("Store: Base path is not a directory: " + base_path_.string());
  }
}


//==============================================
// KEY HANDLING
//==============================================

std::string Store::sanitize(const std::string& file_name) {
  // Trailing separators do not name a component
  std::size_t end = file_name.find_last_not_of('/');
  if (end == std::string::npos) {
    return "";
  }

  std::size_t start = file_name.find_last_of('/', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return file_name.substr(start, end - start + 1);
}

bool Store::is_valid_key(const std::string& key) {
  return !key.empty()
      && key != "."
      && key != ".."
      && key.find('/') == std::string::npos
      && key.find('\0') == std::string::npos;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<ExclusiveFile> Store::create_exclusive(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  BOOST_LOG_TRIVIAL(debug) << "Store: Creating file exclusively: " << file_path.string();
  return ExclusiveFile::create(file_path);
}

std::ifstream Store::open_for_read(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << file_path.string();
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }
  return file;
}

void Store::remove(const std::string& key) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing file with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  if (std::filesystem::remove(file_path, ec)) {
    BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed file with key: " << key;
    return;
  }

  BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file with key: " << key
                           << (ec ? ": " + ec.message() : std::string(""));
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  bool exists = std::filesystem::exists(file_path, ec);

  BOOST_LOG_TRIVIAL(debug) << "Store: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

std::optional<std::uintmax_t> Store::get_file_size(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;

  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: No regular file at path: " << file_path.string();
    return std::nullopt;
  }

  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to stat " << file_path.string() << ": " << ec.message();
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: File size for key " << key << ": " << size << " bytes";
  return size;
}

std::uintmax_t Store::available_space() const {
  std::error_code ec;
  std::filesystem::space_info info = std::filesystem::space(base_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to query free space of " << base_path_.string() << ": " << ec.message();
    throw StoreError("Store: Cannot check disk space: " + ec.message());
  }
  return info.available;
}


//==============================================
// UTILITY METHODS 
//==============================================

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  if (!is_valid_key(key)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid key: " << key;
    throw StoreError("Store: Invalid key: " + key);
  }
  return base_path_ / key;
}

} // namespace store
} // namespace fts
