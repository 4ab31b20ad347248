#ifndef TPN_CONNECTION_HPP
#define TPN_CONNECTION_HPP

#include <cstddef>
#include <cstdint>

#include "tpn/errors.hpp"

namespace tpn {

// Abstract interface for the ordered, reliable, bidirectional byte stream
// between the two peers. Implementations can wrap TCP sockets, in-memory
// pipes, TLS connections, QUIC streams, etc.
//
// A Session reads from one thread and writes from another, and may close from
// a third, so Read, Write and Close must be callable concurrently.
class Connection {
public:
  virtual ~Connection() = default;

  // Write data to the connection.
  // Returns the number of bytes written, which may be less than len.
  // This is a blocking call that writes at least one byte or fails.
  virtual Result<size_t> Write(const uint8_t *data, size_t len) = 0;

  // Read data from the connection.
  // Returns the number of bytes read, or 0 / Error::EOF_ at end of stream.
  // This is a blocking call that waits for at least some data.
  virtual Result<size_t> Read(uint8_t *buf, size_t max_len) = 0;

  // Close the connection. Must unblock any pending Read or Write.
  virtual Error Close() = 0;

  // Check if the connection is closed.
  virtual bool IsClosed() const = 0;
};

} // namespace tpn

#endif // TPN_CONNECTION_HPP
