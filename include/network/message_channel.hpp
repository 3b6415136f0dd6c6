#ifndef FTS_NETWORK_MESSAGE_CHANNEL_HPP
#define FTS_NETWORK_MESSAGE_CHANNEL_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "network/message.hpp"
#include "network/network_error.hpp"

namespace fts {
namespace network {

// Typed message exchange over one connection. Raw payload bytes may be
// interleaved between frames; their count is always announced by the
// preceding message, so both modes share the connection without ambiguity.
class MessageChannel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~MessageChannel() = default;


    // ---- TYPED MESSAGE EXCHANGE ----
    // Blocks until a full frame arrives. Returns CONNECTION_CLOSED when the
    // peer ended the stream cleanly before a new frame started.
    virtual NetworkError receive(Message& message) = 0;
    virtual bool send(const Message& message) = 0;


    // ---- RAW PAYLOAD EXCHANGE ----
    // Reads at most size payload bytes, returns 0 once the stream has ended
    virtual std::size_t read_payload(char* data, std::size_t size) = 0;
    virtual bool write_payload(const char* data, std::size_t size) = 0;


    // ---- CONNECTION CONTROL ----
    virtual void close() = 0;
    virtual bool is_open() const = 0;


    // ---- RESPONSE HELPERS ----
    bool send_response(bool ok, const std::string& message) {
        return send(Response{ok, message});
    }

    bool send_retrieval_response(bool ok, const std::string& message, uint64_t size) {
        return send(RetrievalResponse{ok, message, size});
    }

    bool send_checksum_verification(const std::vector<uint8_t>& checksum) {
        return send(ChecksumVerification{checksum});
    }

protected:
    MessageChannel() = default;
};

} // namespace network
} // namespace fts

#endif // FTS_NETWORK_MESSAGE_CHANNEL_HPP
