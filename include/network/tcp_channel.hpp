#ifndef FTS_NETWORK_TCP_CHANNEL_HPP
#define FTS_NETWORK_TCP_CHANNEL_HPP

#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "network/codec.hpp"
#include "network/message_channel.hpp"

namespace fts {
namespace network {

class TCP_Channel : public MessageChannel {
public:
    // Delete copy operations to prevent socket duplication
    TCP_Channel(const TCP_Channel&) = delete;
    TCP_Channel& operator=(const TCP_Channel&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // Takes ownership of a connected socket
    explicit TCP_Channel(boost::asio::ip::tcp::socket socket);
    ~TCP_Channel() override;


    // ---- TYPED MESSAGE EXCHANGE ----
    NetworkError receive(Message& message) override;
    bool send(const Message& message) override;


    // ---- RAW PAYLOAD EXCHANGE ----
    std::size_t read_payload(char* data, std::size_t size) override;
    bool write_payload(const char* data, std::size_t size) override;


    // ---- CONNECTION CONTROL ----
    void close() override;
    bool is_open() const override;
    // Shuts the socket down so that a read blocked on another thread returns.
    // The descriptor itself is released later by close().
    void interrupt();


    // ---- GETTERS ----
    const std::string& get_remote_address() const;

private:
    // ---- PARAMETERS ----
    boost::asio::ip::tcp::socket socket_;
    Codec codec_;
    std::string remote_address_;

    // Serializes writes of frames and payload chunks
    std::mutex io_mutex_;
    // Guards socket open/close state against interrupt()
    mutable std::mutex state_mutex_;


    // ---- INCOMING DATA PROCESSING ----
    // Reads exactly size bytes, classifying failures for receive()
    NetworkError read_exactly(void* data, std::size_t size, bool frame_started);
};

} // namespace network
} // namespace fts

#endif // FTS_NETWORK_TCP_CHANNEL_HPP
