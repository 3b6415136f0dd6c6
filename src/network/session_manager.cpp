#include "network/session_manager.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>

namespace fts {
namespace network {

SessionManager::SessionManager(SessionHandler handler)
  : handler_(std::move(handler)) {
  if (!handler_) {
    BOOST_LOG_TRIVIAL(error) << "Session manager: No session handler provided";
    throw std::invalid_argument("Session manager: Session handler is required");
  }
  BOOST_LOG_TRIVIAL(debug) << "Session manager: initialized";
}

SessionManager::~SessionManager() {
  shutdown();
}

void SessionManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  accepting_ = true;
}

bool SessionManager::create_session(boost::asio::ip::tcp::socket socket) {
  std::lock_guard<std::mutex> lock(mutex_);
  reap_finished_sessions();

  if (!accepting_) {
    BOOST_LOG_TRIVIAL(warning) << "Session manager: Rejecting connection during shutdown";
    boost::system::error_code ec;
    socket.close(ec);
    return false;
  }

  try {
    auto channel = std::make_shared<TCP_Channel>(std::move(socket));
    auto finished = std::make_shared<std::atomic<bool>>(false);

    // Registered before its thread starts
    sessions_.push_back(Session{channel, finished, std::thread()});
    try {
      sessions_.back().thread = std::thread([this, channel, finished]() {
        try {
          handler_(*channel);
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "Session manager: Session with " << channel->get_remote_address()
                                   << " failed: " << e.what();
        }
        channel->close();
        finished->store(true);
      });
    } catch (const std::system_error&) {
      sessions_.pop_back();
      channel->close();
      throw;
    }

    BOOST_LOG_TRIVIAL(info) << "Session manager: Started session for " << channel->get_remote_address()
                            << ", active sessions: " << sessions_.size();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Session manager: Error handling new connection: " << e.what();
    return false;
  }
}

void SessionManager::shutdown() {
  std::list<Session> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    sessions.swap(sessions_);
  }

  if (sessions.empty()) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Session manager: Shutting down " << sessions.size() << " sessions";

  // Unblock handlers waiting on their sockets
  for (auto& session : sessions) {
    session.channel->interrupt();
  }

  for (auto& session : sessions) {
    if (session.thread.joinable()) {
      session.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Session manager: All sessions stopped";
}

std::size_t SessionManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = 0;
  for (const auto& session : sessions_) {
    if (!session.finished->load()) {
      ++active;
    }
  }
  return active;
}

void SessionManager::reap_finished_sessions() {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->finished->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace network
} // namespace fts
