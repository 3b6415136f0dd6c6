#include "transfer/transfer_engine.hpp"
#include "transfer/stream_copy.hpp"
#include "checksum/checksum.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

namespace fts {
namespace transfer {

namespace {

// Closes the channel when the session loop exits, whatever the reason
class ScopedChannelClose {
public:
  explicit ScopedChannelClose(network::MessageChannel& channel) : channel_(channel) {}
  ~ScopedChannelClose() { channel_.close(); }

  ScopedChannelClose(const ScopedChannelClose&) = delete;
  ScopedChannelClose& operator=(const ScopedChannelClose&) = delete;

private:
  network::MessageChannel& channel_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferEngine::TransferEngine(network::MessageChannel& channel, const store::Store& store)
  : channel_(channel)
  , store_(store) {
}


//==============================================
// SESSION LOOP
//==============================================

void TransferEngine::run() {
  ScopedChannelClose closer(channel_);
  BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Session started";

  while (true) {
    network::Message message;
    network::NetworkError result = channel_.receive(message);

    if (result == network::NetworkError::CONNECTION_CLOSED) {
      BOOST_LOG_TRIVIAL(info) << "Transfer engine: Client closed the connection";
      return;
    }
    if (result != network::NetworkError::SUCCESS) {
      BOOST_LOG_TRIVIAL(error) << "Transfer engine: Receive failed, terminating client: "
                               << network::network_error_to_string(result);
      return;
    }

    WorkflowResult outcome = WorkflowResult::CONTINUE;
    try {
      switch (network::message_type(message)) {
        case network::MessageType::STORAGE_REQUEST:
          outcome = handle_storage(std::get<network::StorageRequest>(message));
          break;
        case network::MessageType::RETRIEVAL_REQUEST:
          outcome = handle_retrieval(std::get<network::RetrievalRequest>(message));
          break;
        case network::MessageType::EMPTY:
          BOOST_LOG_TRIVIAL(info) << "Transfer engine: Received an empty message, terminating client";
          return;
        default:
          BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Unexpected message type: "
                                     << network::message_type_to_string(network::message_type(message));
          break;
      }
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Transfer engine: Workflow failed, terminating client: " << e.what();
      return;
    }

    if (outcome == WorkflowResult::DISCONNECT) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Workflow ended the session";
      return;
    }
  }
}


//==============================================
// STORAGE WORKFLOW
//==============================================

TransferEngine::WorkflowResult TransferEngine::handle_storage(const network::StorageRequest& request) {
  // Extract only the base filename (no directories)
  const std::string key = store::Store::sanitize(request.file_name);
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Attempting to store " << key << " (" << request.size << " bytes)";

  if (!store::Store::is_valid_key(key)) {
    return reject_storage("Invalid file name");
  }

  if (store_.has(key)) {
    return reject_storage("File already exists");
  }

  std::uintmax_t available_space;
  try {
    available_space = store_.available_space();
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << e.what();
    return reject_storage("Cannot check disk space");
  }
  if (available_space < request.size) {
    return reject_storage("Insufficient disk space");
  }

  // The exclusive create, not the existence check above, decides a race
  std::unique_ptr<store::ExclusiveFile> file;
  try {
    file = store_.create_exclusive(key);
  } catch (const store::StoreError& e) {
    return reject_storage(e.what());
  }

  if (!channel_.send_response(true, "Ready for data")) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not announce readiness for " << key;
    file.reset();
    store_.remove(key);
    channel_.close();
    return WorkflowResult::DISCONNECT;
  }

  // Write and checksum as we go
  std::vector<uint8_t> server_checksum;
  bool write_failed = false;
  try {
    checksum::Checksum checksum;
    CopyResult copy = tee_copy(
      [this](char* data, std::size_t size) { return channel_.read_payload(data, size); },
      [&file](const char* data, std::size_t size) { return file->write(data, size); },
      request.size,
      checksum);

    if (copy.status == CopyStatus::SINK_FAILED) {
      write_failed = true;
      drain_payload(request.size - copy.bytes_read);
    }
    if (!file->close()) {
      write_failed = true;
    }
    server_checksum = checksum.finalize();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Data phase for " << key << " failed: " << e.what();
    file.reset();
    store_.remove(key);
    throw;
  }

  // Receive client's checksum
  network::Message reply;
  network::NetworkError result = channel_.receive(reply);
  if (result != network::NetworkError::SUCCESS) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Error receiving checksum: "
                             << network::network_error_to_string(result);
    store_.remove(key);
    return WorkflowResult::CONTINUE;
  }

  const auto* client_checksum = std::get_if<network::ChecksumVerification>(&reply);
  if (!client_checksum) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Expected a checksum, got "
                               << network::message_type_to_string(network::message_type(reply));
  }

  if (write_failed) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: FAILED to store " << key << ". Write error.";
    store_.remove(key);
    if (!channel_.send_response(false, "Failed to write file")) {
      BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not report write failure for " << key;
    }
    return WorkflowResult::CONTINUE;
  }

  // Verify checksums and send final response
  if (client_checksum && checksum::verify_checksum(server_checksum, client_checksum->checksum)) {
    BOOST_LOG_TRIVIAL(info) << "Transfer engine: Successfully stored " << key
                            << " (md5 " << checksum::to_hex(server_checksum) << ")";
    if (!channel_.send_response(true, "File stored successfully")) {
      BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not confirm storage of " << key;
    }
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: FAILED to store " << key << ". Invalid checksum.";
    store_.remove(key);
    if (!channel_.send_response(false, "Checksum verification failed")) {
      BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not report checksum failure for " << key;
    }
  }
  return WorkflowResult::CONTINUE;
}

TransferEngine::WorkflowResult TransferEngine::reject_storage(const std::string& reason) {
  BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Rejecting storage request: " << reason;
  if (!channel_.send_response(false, reason)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not deliver rejection";
  }
  channel_.close();
  return WorkflowResult::DISCONNECT;
}

uint64_t TransferEngine::drain_payload(uint64_t remaining) {
  std::vector<char> buffer(64 * 1024);
  uint64_t drained = 0;

  while (drained < remaining) {
    std::size_t chunk_size = static_cast<std::size_t>(
      std::min<uint64_t>(buffer.size(), remaining - drained));
    std::size_t bytes_read = channel_.read_payload(buffer.data(), chunk_size);
    if (bytes_read == 0) {
      break;
    }
    drained += bytes_read;
  }

  BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Discarded " << drained << " of " << remaining << " payload bytes";
  return drained;
}


//==============================================
// RETRIEVAL WORKFLOW
//==============================================

TransferEngine::WorkflowResult TransferEngine::handle_retrieval(const network::RetrievalRequest& request) {
  // Extract only the base filename (no directories)
  const std::string key = store::Store::sanitize(request.file_name);
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Attempting to retrieve " << key;

  if (!store::Store::is_valid_key(key)) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Invalid file name requested: " << request.file_name;
    return reject_retrieval("File not found");
  }

  // Get file size and make sure it exists
  std::optional<std::uintmax_t> size = store_.get_file_size(key);
  if (!size) {
    BOOST_LOG_TRIVIAL(info) << "Transfer engine: File not found: " << key;
    return reject_retrieval("File not found");
  }

  if (!channel_.send_retrieval_response(true, "Ready to send", *size)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not announce retrieval of " << key;
    channel_.close();
    return WorkflowResult::DISCONNECT;
  }

  std::ifstream file;
  try {
    file = store_.open_for_read(key);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Error opening file: " << e.what();
    return WorkflowResult::CONTINUE;
  }

  // Checksum and transfer file at same time
  checksum::Checksum checksum;
  CopyResult copy = tee_copy(
    [&file](char* data, std::size_t size) -> std::size_t {
      file.read(data, static_cast<std::streamsize>(size));
      return static_cast<std::size_t>(file.gcount());
    },
    [this](const char* data, std::size_t size) { return channel_.write_payload(data, size); },
    *size,
    checksum);
  file.close();

  if (copy.status != CopyStatus::COMPLETE) {
    // The client is waiting for bytes that will never arrive
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Transfer of " << key << " aborted after "
                             << copy.bytes_written << " of " << *size << " bytes: "
                             << copy_status_to_string(copy.status);
    channel_.close();
    return WorkflowResult::DISCONNECT;
  }

  std::vector<uint8_t> digest = checksum.finalize();
  if (!channel_.send_checksum_verification(digest)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not send checksum for " << key;
    return WorkflowResult::CONTINUE;
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Sent " << key << " (" << *size << " bytes, md5 "
                          << checksum::to_hex(digest) << ")";
  return WorkflowResult::CONTINUE;
}

TransferEngine::WorkflowResult TransferEngine::reject_retrieval(const std::string& reason) {
  if (!channel_.send_retrieval_response(false, reason, 0)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Could not deliver rejection";
  }
  channel_.close();
  return WorkflowResult::DISCONNECT;
}

} // namespace transfer
} // namespace fts
