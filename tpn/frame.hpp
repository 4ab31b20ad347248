#ifndef TPN_FRAME_HPP
#define TPN_FRAME_HPP

#include <cstdint>
#include <cstring>
#include <vector>

#include "tpn/connection.hpp"
#include "tpn/errors.hpp"
#include "tpn/types.hpp"

namespace tpn {

// Check a configured frame size (1..kMaxFrameSize)
Error ValidateFrameSizeConfig(size_t frame_size);

// Check a caller-supplied payload against the session frame size
Error ValidateFrameSize(size_t len, size_t frame_size);

// Write all of data, retrying partial writes.
// Returns Error::TransportError if the connection fails or stops making
// progress before every byte is written.
Error WriteFull(Connection& conn, const uint8_t* data, size_t len);

// Read exactly n bytes. Never reads past n.
// Returns Error::TransportError if the stream ends before any byte arrives,
// Error::TruncatedFrame if it ends part way through.
Result<std::vector<uint8_t>> ReadFull(Connection& conn, size_t n);

// Incremental reader that cuts a byte stream into fixed-size frames
class FrameReader {
 public:
  explicit FrameReader(size_t frame_size);

  // Feed data to the reader. Returns number of bytes consumed.
  // Stops consuming once a complete frame is buffered.
  size_t Feed(const uint8_t* data, size_t len);

  // Check if a complete frame is available
  bool HasFrame() const { return buf_.size() == frame_size_; }

  // Get the buffered frame (only valid when HasFrame() returns true)
  std::vector<uint8_t> TakeFrame();

  // Bytes of an incomplete frame held by the reader
  size_t Buffered() const { return HasFrame() ? 0 : buf_.size(); }

  size_t FrameSize() const { return frame_size_; }

  // Reset reader state
  void Reset();

 private:
  size_t frame_size_;
  std::vector<uint8_t> buf_;
};

// Negotiation hello exchanged when SessionConfig::exchange_frame_size is set
struct Hello {
  uint8_t version = kHelloVersion;
  FirstMoverPolicy policy = FirstMoverPolicy::Initiator;
  uint32_t frame_size = 0;

  // Encode hello to buffer (must be at least kHelloSize bytes)
  void Encode(uint8_t* buf) const;

  // Decode hello from buffer (must be at least kHelloSize bytes)
  static Result<Hello> Decode(const uint8_t* buf);
};

}  // namespace tpn

#endif  // TPN_FRAME_HPP
