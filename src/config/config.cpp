#include "config/config.hpp"
#include <sstream>
#include <system_error>
#include <vector>
#include <boost/log/trivial.hpp>

namespace fts {
namespace config {

namespace {

uint16_t parse_port(const std::string& value) {
  std::size_t consumed = 0;
  unsigned long port = 0;
  try {
    port = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("Invalid port number: " + value);
  }

  if (consumed != value.size() || port == 0 || port > 65535) {
    throw ConfigError("Invalid port number: " + value);
  }
  return static_cast<uint16_t>(port);
}

} // namespace

//==============================================
// COMMAND LINE
//==============================================

ServerConfig parse_command_line(int argc, const char* const argv[]) {
  ServerConfig config;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
      return config;
    }

    bool takes_value = arg == "-a" || arg == "--address"
                    || arg == "-l" || arg == "--log-level"
                    || arg == "-f" || arg == "--log-file";
    if (takes_value) {
      if (i + 1 >= argc) {
        throw ConfigError("Missing value for " + arg);
      }
      const std::string value(argv[++i]);

      if (arg == "-a" || arg == "--address") {
        config.address = value;
      } else if (arg == "-l" || arg == "--log-level") {
        if (!logging::parse_severity(value, config.logging.level)) {
          throw ConfigError("Unknown log level: " + value);
        }
      } else {
        config.logging.log_file = value;
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      throw ConfigError("Unknown argument: " + arg);
    }
    positional.push_back(arg);
  }

  if (positional.empty()) {
    throw ConfigError("Not enough arguments");
  }
  if (positional.size() > 2) {
    throw ConfigError("Too many arguments");
  }

  config.port = parse_port(positional[0]);
  if (positional.size() == 2) {
    config.storage_root = positional[1];
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: port " << config.port << ", address " << config.address
                           << ", storage root " << config.storage_root.string();
  return config;
}

std::string usage(const std::string& program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " <port> [download-dir] [options]\n"
      << "Arguments:\n"
      << "  port                 TCP port to listen on\n"
      << "  download-dir         Directory files are stored in (default: .)\n"
      << "Options:\n"
      << "  -a, --address <ip>   Listen address (default: 0.0.0.0)\n"
      << "  -l, --log-level <l>  trace, debug, info, warning, error or fatal (default: info)\n"
      << "  -f, --log-file <p>   Also write logs to this file\n"
      << "  -h, --help           Show this message\n"
      << "Example: " << program_name << " 3001 ./downloads\n";
  return out.str();
}


//==============================================
// VALIDATION
//==============================================

void validate_storage_root(const std::filesystem::path& storage_root) {
  std::error_code ec;
  auto status = std::filesystem::status(storage_root, ec);

  if (ec || !std::filesystem::exists(status)) {
    throw ConfigError("Storage directory does not exist: " + storage_root.string());
  }
  if (!std::filesystem::is_directory(status)) {
    throw ConfigError("Storage path is not a directory: " + storage_root.string());
  }
}

} // namespace config
} // namespace fts
