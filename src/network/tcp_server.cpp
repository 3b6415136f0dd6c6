#include "network/tcp_server.hpp"

namespace fts {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const uint16_t port, const std::string& address, SessionManager::SessionHandler handler)
  : port_(port)
  , address_(address)
  , is_running_(false)
  , session_manager_(std::move(handler)) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }

  try {
    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    // Create acceptor
    io_context_.restart();
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(
      io_context_,
      endpoint
    );
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Acceptor bound to " << acceptor_->local_endpoint();

    is_running_ = true;
    session_manager_.start();

    // Start accepting connections
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Server started successfully on " << address_ << ":" << get_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Create new socket for incoming connection
  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  // Set up async accept operation
  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        boost::system::error_code ec;
        auto remote = socket->remote_endpoint(ec);
        if (!ec) {
          BOOST_LOG_TRIVIAL(info) << "TCP server: Accepted connection " << remote;
        }
        session_manager_.create_session(std::move(*socket));
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context
  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  session_manager_.shutdown();

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}


//==============================================
// GETTERS AND SETTERS
//==============================================

uint16_t TCP_Server::get_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace network
} // namespace fts
