#ifndef FTS_CONFIG_HPP
#define FTS_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"

namespace fts {
namespace config {

struct ServerConfig {
  uint16_t port{0};
  std::string address{"0.0.0.0"};
  std::filesystem::path storage_root{"."};
  logging::LogConfig logging;
  bool show_help{false};
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// ---- COMMAND LINE ----
// Parses: <port> [download-dir] [-a address] [-l level] [-f log-file] [-h]
ServerConfig parse_command_line(int argc, const char* const argv[]);
std::string usage(const std::string& program_name);


// ---- VALIDATION ----
// Throws ConfigError unless the path exists and is a directory
void validate_storage_root(const std::filesystem::path& storage_root);

} // namespace config
} // namespace fts

#endif // FTS_CONFIG_HPP
