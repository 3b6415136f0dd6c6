#ifndef FTS_CHECKSUM_ERROR_HPP
#define FTS_CHECKSUM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fts::checksum {

class ChecksumError : public std::runtime_error {
public:
    explicit ChecksumError(const std::string& message) 
        : std::runtime_error(message) {}
};

} // namespace fts::checksum

#endif // FTS_CHECKSUM_ERROR_HPP
