#ifndef FTS_TRANSFER_STREAM_COPY_HPP
#define FTS_TRANSFER_STREAM_COPY_HPP

#include <cstdint>
#include <functional>
#include "checksum/checksum.hpp"

namespace fts {
namespace transfer {

// Reads up to size bytes into data, returns 0 when no more bytes will come
using ByteSource = std::function<std::size_t(char* data, std::size_t size)>;
// Consumes exactly size bytes, returns false on failure
using ByteSink = std::function<bool(const char* data, std::size_t size)>;

enum class CopyStatus {
  COMPLETE,
  SOURCE_ENDED,
  SINK_FAILED
};

struct CopyResult {
  CopyStatus status;
  // Bytes taken from the source, including a chunk the sink rejected
  uint64_t bytes_read;
  // Bytes accepted by the sink and fed into the checksum
  uint64_t bytes_written;
};

// Moves exactly count bytes from source to sink, feeding every byte the sink
// accepts through the checksum. Never reads past count.
CopyResult tee_copy(const ByteSource& source, const ByteSink& sink, uint64_t count,
                    checksum::Checksum& checksum, std::size_t buffer_size = 64 * 1024);

const char* copy_status_to_string(CopyStatus status);

} // namespace transfer
} // namespace fts

#endif // FTS_TRANSFER_STREAM_COPY_HPP
