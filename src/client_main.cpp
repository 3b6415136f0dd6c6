#include <filesystem>
#include <iostream>
#include <string>
#include <boost/log/trivial.hpp>
#include "client/transfer_client.hpp"
#include "logger/logger.hpp"

namespace {

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <host> <port> put <local-file> [remote-name]\n"
            << "       " << program_name << " <host> <port> get <remote-name> [local-file]\n"
            << "Example: " << program_name << " 127.0.0.1 3001 put notes.txt\n";
}

} // namespace

int main(int argc, char* argv[]) {
  if (argc < 5 || argc > 6) {
    print_usage(argv[0]);
    return 1;
  }

  const std::string host(argv[1]);
  const std::string command(argv[3]);
  const std::string name(argv[4]);

  uint16_t port = 0;
  try {
    unsigned long value = std::stoul(argv[2]);
    if (value == 0 || value > 65535) {
      throw std::out_of_range("port");
    }
    port = static_cast<uint16_t>(value);
  } catch (const std::exception&) {
    std::cerr << "Error: Invalid port number: " << argv[2] << '\n';
    print_usage(argv[0]);
    return 1;
  }

  fts::logging::LogConfig log_config;
  log_config.level = boost::log::trivial::warning;
  fts::logging::init_logging(log_config);

  fts::client::TransferClient client(host, port);
  if (!client.connect()) {
    std::cerr << "Error: Failed to connect to " << host << ":" << port << '\n';
    return 1;
  }

  fts::client::TransferResult result;
  if (command == "put") {
    std::string remote_name = argc == 6 ? argv[5] : std::filesystem::path(name).filename().string();
    result = client.store_file(name, remote_name);
  } else if (command == "get") {
    std::string local_name = argc == 6 ? argv[5] : fts::client::default_local_name(name);
    if (local_name.empty()) {
      std::cerr << "Error: Cannot derive a local file name from " << name << '\n';
      return 1;
    }
    result = client.retrieve_file(name, local_name);
  } else {
    std::cerr << "Error: Unknown command: " << command << '\n';
    print_usage(argv[0]);
    return 1;
  }

  std::cout << (result.ok ? "OK: " : "FAILED: ") << result.message << std::endl;
  return result.ok ? 0 : 1;
}
