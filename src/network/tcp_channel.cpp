#include "network/tcp_channel.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace fts {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Channel::TCP_Channel(boost::asio::ip::tcp::socket socket)
  : socket_(std::move(socket)) {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  } else {
    remote_address_ = "unknown";
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Channel created for " << remote_address_;
}

// Cleanup connection on destruction
TCP_Channel::~TCP_Channel() {
  close();
  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Channel destroyed for " << remote_address_;
}


//==============================================
// TYPED MESSAGE EXCHANGE
//==============================================

NetworkError TCP_Channel::receive(Message& message) {
  if (!is_open()) {
    return NetworkError::CONNECTION_CLOSED;
  }

  uint8_t header[Codec::HEADER_SIZE];
  NetworkError result = read_exactly(header, sizeof(header), false);
  if (result != NetworkError::SUCCESS) {
    return result;
  }

  uint32_t body_length;
  try {
    body_length = Codec::parse_body_length(header);
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Rejected frame from " << remote_address_ << ": " << e.what();
    return NetworkError::INVALID_MESSAGE;
  }

  // Reassemble the whole frame so the codec sees exactly one message
  std::string frame(reinterpret_cast<const char*>(header), sizeof(header));
  frame.resize(sizeof(header) + body_length);
  if (body_length > 0) {
    result = read_exactly(&frame[sizeof(header)], body_length, true);
    if (result != NetworkError::SUCCESS) {
      return result;
    }
  }

  try {
    std::istringstream input(frame);
    message = codec_.deserialize(input);
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Invalid message from " << remote_address_ << ": " << e.what();
    return NetworkError::INVALID_MESSAGE;
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Received " << message_type_to_string(message_type(message))
                           << " from " << remote_address_;
  return NetworkError::SUCCESS;
}

bool TCP_Channel::send(const Message& message) {
  std::ostringstream output;
  try {
    codec_.serialize(message, output);
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Failed to serialize message: " << e.what();
    return false;
  }

  const std::string frame = output.str();
  std::lock_guard<std::mutex> lock(io_mutex_);
  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(frame), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Failed to send " << message_type_to_string(message_type(message))
                             << " to " << remote_address_ << ": " << ec.message();
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Sent " << message_type_to_string(message_type(message))
                           << " to " << remote_address_;
  return true;
}


//==============================================
// RAW PAYLOAD EXCHANGE
//==============================================

std::size_t TCP_Channel::read_payload(char* data, std::size_t size) {
  if (size == 0) {
    return 0;
  }

  boost::system::error_code ec;
  std::size_t bytes_read = socket_.read_some(boost::asio::buffer(data, size), ec);
  if (ec) {
    if (ec == boost::asio::error::eof) {
      BOOST_LOG_TRIVIAL(debug) << "TCP channel: Payload stream from " << remote_address_ << " ended";
    } else {
      BOOST_LOG_TRIVIAL(error) << "TCP channel: Payload read error from " << remote_address_ << ": " << ec.message();
    }
    return 0;
  }
  return bytes_read;
}

bool TCP_Channel::write_payload(const char* data, std::size_t size) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  boost::system::error_code ec;
  std::size_t bytes_written = boost::asio::write(
    socket_,
    boost::asio::buffer(data, size),
    boost::asio::transfer_exactly(size),
    ec);

  if (ec || bytes_written != size) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Payload send error to " << remote_address_ << ": " << ec.message();
    return false;
  }
  return true;
}


//==============================================
// CONNECTION CONTROL
//==============================================

void TCP_Channel::close() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!socket_.is_open()) {
    return;
  }

  boost::system::error_code ec;

  // Shutdown both send and receive operations
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(warning) << "TCP channel: Socket shutdown error: " << ec.message();
  }

  socket_.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Socket close error: " << ec.message();
  }

  BOOST_LOG_TRIVIAL(info) << "TCP channel: Closed connection to " << remote_address_;
}

void TCP_Channel::interrupt() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!socket_.is_open()) {
    return;
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(warning) << "TCP channel: Interrupt of " << remote_address_ << " failed: " << ec.message();
  }
}

bool TCP_Channel::is_open() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return socket_.is_open();
}


//==============================================
// INCOMING DATA PROCESSING
//==============================================

NetworkError TCP_Channel::read_exactly(void* data, std::size_t size, bool frame_started) {
  boost::system::error_code ec;
  std::size_t bytes_read = boost::asio::read(
    socket_,
    boost::asio::buffer(data, size),
    boost::asio::transfer_exactly(size),
    ec);

  if (!ec) {
    return NetworkError::SUCCESS;
  }

  // A clean end of stream between frames is not an error
  if (ec == boost::asio::error::eof && bytes_read == 0 && !frame_started) {
    BOOST_LOG_TRIVIAL(debug) << "TCP channel: " << remote_address_ << " ended the stream";
    return NetworkError::CONNECTION_CLOSED;
  }

  BOOST_LOG_TRIVIAL(error) << "TCP channel: Read error from " << remote_address_ << ": " << ec.message();
  return NetworkError::CONNECTION_LOST;
}


//==============================================
// GETTERS
//==============================================

const std::string& TCP_Channel::get_remote_address() const {
  return remote_address_;
}

} // namespace network
} // namespace fts
