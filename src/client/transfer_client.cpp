#include "client/transfer_client.hpp"
#include "checksum/checksum.hpp"
#include "store/store.hpp"
#include "transfer/stream_copy.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <system_error>

namespace fts {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferClient::TransferClient(const std::string& host, uint16_t port)
  : host_(host)
  , port_(port) {
}

TransferClient::~TransferClient() {
  close();
}


//==============================================
// CONNECTION CONTROL
//==============================================

bool TransferClient::connect() {
  try {
    // Resolve remote address to endpoints
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_));

    boost::asio::ip::tcp::socket socket(io_context_);
    boost::asio::connect(socket, endpoints);

    channel_ = std::make_unique<network::TCP_Channel>(std::move(socket));
    BOOST_LOG_TRIVIAL(info) << "Transfer client: Connected to " << host_ << ":" << port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Connection to " << host_ << ":" << port_ << " failed: " << e.what();
    return false;
  }
}

void TransferClient::close() {
  if (channel_) {
    channel_->close();
    channel_.reset();
  }
}

bool TransferClient::is_connected() const {
  return channel_ && channel_->is_open();
}


//==============================================
// TRANSFERS
//==============================================

TransferResult TransferClient::store_file(const std::filesystem::path& local_path, const std::string& remote_name) {
  std::error_code ec;
  uint64_t size = std::filesystem::file_size(local_path, ec);
  if (ec) {
    return TransferResult{false, "Cannot read " + local_path.string() + ": " + ec.message()};
  }

  std::ifstream input(local_path, std::ios::binary);
  if (!input) {
    return TransferResult{false, "Cannot open " + local_path.string()};
  }
  return store_stream(input, size, remote_name);
}

TransferResult TransferClient::store_stream(std::istream& input, uint64_t size, const std::string& remote_name) {
  if (!is_connected()) {
    return TransferResult{false, "Not connected"};
  }

  if (!channel_->send(network::StorageRequest{remote_name, size})) {
    return fail("Failed to send storage request");
  }

  TransferResult ready = await_response();
  if (!ready.ok) {
    return ready;
  }

  checksum::Checksum checksum;
  transfer::CopyResult copy = transfer::tee_copy(
    [&input](char* data, std::size_t count) -> std::size_t {
      input.read(data, static_cast<std::streamsize>(count));
      return static_cast<std::size_t>(input.gcount());
    },
    [this](const char* data, std::size_t count) { return channel_->write_payload(data, count); },
    size,
    checksum);

  if (copy.status != transfer::CopyStatus::COMPLETE) {
    return fail(std::string("Upload aborted: ") + transfer::copy_status_to_string(copy.status));
  }

  if (!channel_->send_checksum_verification(checksum.finalize())) {
    return fail("Failed to send checksum");
  }
  return await_response();
}

TransferResult TransferClient::retrieve_file(const std::string& remote_name, const std::filesystem::path& local_path) {
  if (!is_connected()) {
    return TransferResult{false, "Not connected"};
  }

  if (!channel_->send(network::RetrievalRequest{remote_name})) {
    return fail("Failed to send retrieval request");
  }

  network::Message message;
  network::NetworkError result = channel_->receive(message);
  if (result != network::NetworkError::SUCCESS) {
    return fail(std::string("No retrieval response: ") + network::network_error_to_string(result));
  }

  const auto* ready = std::get_if<network::RetrievalResponse>(&message);
  if (!ready) {
    return fail("Unexpected reply to retrieval request");
  }
  if (!ready->ok) {
    return TransferResult{false, ready->message};
  }
  const uint64_t size = ready->size;

  std::ofstream output(local_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    // The payload is already on its way, the connection cannot be reused
    return fail("Cannot create " + local_path.string());
  }

  checksum::Checksum checksum;
  transfer::CopyResult copy = transfer::tee_copy(
    [this](char* data, std::size_t count) { return channel_->read_payload(data, count); },
    [&output](const char* data, std::size_t count) {
      return static_cast<bool>(output.write(data, static_cast<std::streamsize>(count)));
    },
    size,
    checksum);
  output.close();

  std::error_code ec;
  if (copy.status != transfer::CopyStatus::COMPLETE || !output) {
    std::filesystem::remove(local_path, ec);
    return fail("Download of " + remote_name + " incomplete");
  }

  result = channel_->receive(message);
  const auto* server_checksum = std::get_if<network::ChecksumVerification>(&message);
  if (result != network::NetworkError::SUCCESS || !server_checksum) {
    std::filesystem::remove(local_path, ec);
    return fail("No checksum received for " + remote_name);
  }

  if (!checksum::verify_checksum(checksum.finalize(), server_checksum->checksum)) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer client: Checksum mismatch for " << remote_name;
    std::filesystem::remove(local_path, ec);
    return TransferResult{false, "Checksum verification failed"};
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer client: Retrieved " << remote_name << " (" << size << " bytes)";
  return TransferResult{true, "File retrieved successfully"};
}


//==============================================
// RESPONSE HANDLING
//==============================================

TransferResult TransferClient::await_response() {
  network::Message message;
  network::NetworkError result = channel_->receive(message);
  if (result != network::NetworkError::SUCCESS) {
    return fail(std::string("No response: ") + network::network_error_to_string(result));
  }

  const auto* response = std::get_if<network::Response>(&message);
  if (!response) {
    return fail(std::string("Unexpected ") + network::message_type_to_string(network::message_type(message)));
  }
  return TransferResult{response->ok, response->message};
}

// Protocol state is unknown after these failures, so the connection is dropped
TransferResult TransferClient::fail(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Transfer client: " << message;
  close();
  return TransferResult{false, message};
}

std::string default_local_name(const std::string& remote_name) {
  std::string name = store::Store::sanitize(remote_name);
  return store::Store::is_valid_key(name) ? name : std::string();
}

} // namespace client
} // namespace fts
