#ifndef FTS_CLIENT_TRANSFER_CLIENT_HPP
#define FTS_CLIENT_TRANSFER_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "network/tcp_channel.hpp"

namespace fts {
namespace client {

struct TransferResult {
  bool ok{false};
  std::string message;
};

// Local file a download lands in when no name is given: the last component
// of the remote name. Empty if the remote name has no usable component.
std::string default_local_name(const std::string& remote_name);

// Client side of the transfer protocol over one TCP connection
class TransferClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferClient(const std::string& host, uint16_t port);
  ~TransferClient();

  TransferClient(const TransferClient&) = delete;
  TransferClient& operator=(const TransferClient&) = delete;


  // ---- CONNECTION CONTROL ----
  bool connect();
  void close();
  bool is_connected() const;


  // ---- TRANSFERS ----
  // Uploads a local file under remote_name
  TransferResult store_file(const std::filesystem::path& local_path, const std::string& remote_name);
  // Uploads exactly size bytes read from input under remote_name
  TransferResult store_stream(std::istream& input, uint64_t size, const std::string& remote_name);
  // Downloads remote_name into local_path, which is removed again if the
  // transfer is short or the checksum does not match
  TransferResult retrieve_file(const std::string& remote_name, const std::filesystem::path& local_path);

private:
  // ---- PARAMETERS ----
  std::string host_;
  uint16_t port_;
  // Must outlive the channel's socket
  boost::asio::io_context io_context_;
  std::unique_ptr<network::TCP_Channel> channel_;


  // ---- RESPONSE HANDLING ----
  // Waits for a status response, failing if anything else arrives
  TransferResult await_response();
  TransferResult fail(const std::string& message);
};

} // namespace client
} // namespace fts

#endif // FTS_CLIENT_TRANSFER_CLIENT_HPP
