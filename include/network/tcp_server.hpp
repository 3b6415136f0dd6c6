#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <memory>
#include <string>
#include <thread>
#include "network/session_manager.hpp"

namespace fts {
namespace network {

class TCP_Server {
public:
  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 lets the OS pick a free port, see get_port()
  TCP_Server(const uint16_t port, const std::string& address, SessionManager::SessionHandler handler);
  ~TCP_Server();

  TCP_Server(const TCP_Server&) = delete;
  TCP_Server& operator=(const TCP_Server&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS AND SETTERS ----
  // Port the acceptor is bound to, 0 before start_listener()
  uint16_t get_port() const;
  bool is_running() const { return is_running_; }
  SessionManager& get_session_manager() { return session_manager_; }

private:

  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Accepted sockets live on io_context_, so sessions are declared after it
  SessionManager session_manager_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace network
} // namespace fts
