#ifndef FTS_TRANSFER_ENGINE_HPP
#define FTS_TRANSFER_ENGINE_HPP

#include <cstdint>
#include <string>
#include "network/message.hpp"
#include "network/message_channel.hpp"
#include "store/store.hpp"

namespace fts {
namespace transfer {

// Serves one connection: receives requests one at a time and runs the
// storage or retrieval workflow for each against the shared store.
class TransferEngine {
public:
  enum class WorkflowResult {
    CONTINUE,    // session stays usable for the next request
    DISCONNECT   // channel was closed, the session is over
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferEngine(network::MessageChannel& channel, const store::Store& store);


  // ---- SESSION LOOP ----
  // Processes requests until the client leaves or the channel fails. The
  // channel is closed on return.
  void run();


  // ---- WORKFLOWS ----
  // Receives a file from the client and keeps it only if checksums match
  WorkflowResult handle_storage(const network::StorageRequest& request);
  // Sends a stored file followed by its checksum
  WorkflowResult handle_retrieval(const network::RetrievalRequest& request);

private:
  // ---- PARAMETERS ----
  network::MessageChannel& channel_;
  const store::Store& store_;


  // ---- STORAGE SUPPORT ----
  // Sends a failed status, then closes the channel
  WorkflowResult reject_storage(const std::string& reason);
  // Reads and discards payload bytes so the next frame starts where expected
  uint64_t drain_payload(uint64_t remaining);


  // ---- RETRIEVAL SUPPORT ----
  WorkflowResult reject_retrieval(const std::string& reason);
};

} // namespace transfer
} // namespace fts

#endif // FTS_TRANSFER_ENGINE_HPP
