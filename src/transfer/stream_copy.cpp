#include "transfer/stream_copy.hpp"
#include <algorithm>
#include <vector>
#include <boost/log/trivial.hpp>

namespace fts {
namespace transfer {

CopyResult tee_copy(const ByteSource& source, const ByteSink& sink, uint64_t count,
                    checksum::Checksum& checksum, std::size_t buffer_size) {
  std::vector<char> buffer(std::max<std::size_t>(buffer_size, 1));
  CopyResult result{CopyStatus::COMPLETE, 0, 0};

  while (result.bytes_read < count) {
    // Calculate how many bytes to read in this chunk
    uint64_t bytes_remaining = count - result.bytes_read;
    std::size_t chunk_size = static_cast<std::size_t>(
      std::min<uint64_t>(buffer.size(), bytes_remaining));

    std::size_t bytes_read = source(buffer.data(), chunk_size);
    if (bytes_read == 0) {
      BOOST_LOG_TRIVIAL(warning) << "Stream copy: Source ended after " << result.bytes_read
                                 << " of " << count << " bytes";
      result.status = CopyStatus::SOURCE_ENDED;
      return result;
    }
    result.bytes_read += bytes_read;

    if (!sink(buffer.data(), bytes_read)) {
      BOOST_LOG_TRIVIAL(error) << "Stream copy: Sink failed after " << result.bytes_written
                               << " of " << count << " bytes";
      result.status = CopyStatus::SINK_FAILED;
      return result;
    }

    checksum.update(buffer.data(), bytes_read);
    result.bytes_written += bytes_read;
  }

  BOOST_LOG_TRIVIAL(debug) << "Stream copy: Copied " << result.bytes_written << " bytes";
  return result;
}

const char* copy_status_to_string(CopyStatus status) {
  switch (status) {
    case CopyStatus::COMPLETE: return "Complete";
    case CopyStatus::SOURCE_ENDED: return "Source ended";
    case CopyStatus::SINK_FAILED: return "Sink failed";
    default: return "Unknown";
  }
}

} // namespace transfer
} // namespace fts
