#ifndef FTS_NETWORK_SESSION_MANAGER_HPP
#define FTS_NETWORK_SESSION_MANAGER_HPP

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <boost/asio.hpp>
#include "network/message_channel.hpp"
#include "network/tcp_channel.hpp"

namespace fts {
namespace network {

// Runs one handler per accepted connection, each on its own thread
class SessionManager {
public:
  // Serves a connection until it is done with it
  using SessionHandler = std::function<void(MessageChannel&)>;

  // Delete copy constructor and assignment operator
  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit SessionManager(SessionHandler handler);
  ~SessionManager();


  // ---- SESSION MANAGEMENT ----
  // Accepts new sessions again after a shutdown
  void start();
  // Wraps the socket in a channel and starts serving it
  bool create_session(boost::asio::ip::tcp::socket socket);
  // Interrupts every live session and waits for all of them to finish
  void shutdown();


  // ---- UTILITY METHODS ----
  // Number of sessions whose handler is still running
  std::size_t size() const;

private:
  struct Session {
    std::shared_ptr<TCP_Channel> channel;
    std::shared_ptr<std::atomic<bool>> finished;
    std::thread thread;
  };

  // ---- PARAMETERS ----
  SessionHandler handler_;
  std::list<Session> sessions_;
  bool accepting_ = true;
  mutable std::mutex mutex_;

  // Joins sessions whose handler returned. Caller holds mutex_.
  void reap_finished_sessions();
};

} // namespace network
} // namespace fts

#endif // FTS_NETWORK_SESSION_MANAGER_HPP
