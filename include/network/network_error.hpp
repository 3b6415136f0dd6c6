#ifndef FTS_NETWORK_ERROR_HPP
#define FTS_NETWORK_ERROR_HPP

namespace fts {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    CONNECTION_CLOSED,
    CONNECTION_LOST,
    INVALID_MESSAGE,
    TRANSFER_FAILED,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CONNECTION_CLOSED: return "Connection closed";
        case NetworkError::CONNECTION_LOST: return "Connection lost";
        case NetworkError::INVALID_MESSAGE: return "Invalid message";
        case NetworkError::TRANSFER_FAILED: return "Transfer failed";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

} // namespace network
} // namespace fts

#endif // FTS_NETWORK_ERROR_HPP
