#include <csignal>
#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/tcp_server.hpp"
#include "store/store.hpp"
#include "transfer/transfer_engine.hpp"

namespace {

// Blocks until SIGINT or SIGTERM arrives
void wait_for_termination() {
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
    }
  });
  signal_context.run();
}

bool run_server(const fts::config::ServerConfig& config) {
  try {
    // Verify storage directory exists and is a directory
    fts::config::validate_storage_root(config.storage_root);
    fts::store::Store store(config.storage_root);

    fts::network::TCP_Server server(config.port, config.address,
      [&store](fts::network::MessageChannel& channel) {
        fts::transfer::TransferEngine engine(channel, store);
        engine.run();
      });

    if (!server.start_listener()) {
      BOOST_LOG_TRIVIAL(fatal) << "Server: Could not listen on " << config.address << ":" << config.port;
      return false;
    }

    std::cout << "Listening on port: " << server.get_port() << '\n'
              << "Download directory: " << store.get_base_path().string() << std::endl;

    wait_for_termination();
    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Server: " << e.what();
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  fts::config::ServerConfig config;
  try {
    config = fts::config::parse_command_line(argc, argv);
  } catch (const fts::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n' << fts::config::usage(argv[0]);
    return 1;
  }

  if (config.show_help) {
    std::cout << fts::config::usage(argv[0]);
    return 0;
  }

  try {
    fts::logging::init_logging(config.logging);
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  return run_server(config) ? 0 : 1;
}
