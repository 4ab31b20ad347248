#include "tpn/frame.hpp"

#include <algorithm>

namespace tpn {

namespace {

// Big-endian encoding helpers
inline void PutU32BE(uint8_t* buf, uint32_t val) {
  buf[0] = static_cast<uint8_t>(val >> 24);
  buf[1] = static_cast<uint8_t>(val >> 16);
  buf[2] = static_cast<uint8_t>(val >> 8);
  buf[3] = static_cast<uint8_t>(val);
}

inline uint32_t GetU32BE(const uint8_t* buf) {
  return (static_cast<uint32_t>(buf[0]) << 24) |
         (static_cast<uint32_t>(buf[1]) << 16) |
         (static_cast<uint32_t>(buf[2]) << 8) | static_cast<uint32_t>(buf[3]);
}

}  // namespace

Error ValidateFrameSizeConfig(size_t frame_size) {
  if (frame_size == 0 || frame_size > kMaxFrameSize) {
    return Error::InvalidConfig;
  }
  return Error::OK;
}

Error ValidateFrameSize(size_t len, size_t frame_size) {
  if (len != frame_size) {
    return Error::InvalidFrameSize;
  }
  return Error::OK;
}

Error WriteFull(Connection& conn, const uint8_t* data, size_t len) {
  size_t offset = 0;
  while (offset < len) {
    auto result = conn.Write(data + offset, len - offset);
    if (result.error != Error::OK) {
      return Error::TransportError;
    }
    if (result.value == 0) {
      // A blocking write that returns nothing will never finish
      return Error::TransportError;
    }
    offset += std::min(result.value, len - offset);
  }
  return Error::OK;
}

Result<std::vector<uint8_t>> ReadFull(Connection& conn, size_t n) {
  std::vector<uint8_t> buf(n);
  size_t got = 0;

  while (got < n) {
    auto result = conn.Read(buf.data() + got, n - got);
    if (result.error == Error::Timeout) {
      continue;
    }
    if (result.error != Error::OK || result.value == 0) {
      return {{}, got == 0 ? Error::TransportError : Error::TruncatedFrame};
    }
    got += result.value;
  }

  return {std::move(buf), Error::OK};
}

FrameReader::FrameReader(size_t frame_size) : frame_size_(frame_size) {
  buf_.reserve(frame_size_);
}

size_t FrameReader::Feed(const uint8_t* data, size_t len) {
  if (HasFrame()) {
    return 0;
  }

  size_t need = frame_size_ - buf_.size();
  size_t take = std::min(need, len);
  buf_.insert(buf_.end(), data, data + take);
  return take;
}

std::vector<uint8_t> FrameReader::TakeFrame() {
  std::vector<uint8_t> frame = std::move(buf_);
  Reset();
  return frame;
}

void FrameReader::Reset() {
  buf_.clear();
  buf_.reserve(frame_size_);
}

void Hello::Encode(uint8_t* buf) const {
  std::memcpy(buf, kHelloMagic, sizeof(kHelloMagic));
  buf[4] = version;
  buf[5] = static_cast<uint8_t>(policy);
  buf[6] = 0;
  buf[7] = 0;
  PutU32BE(buf + 8, frame_size);
}

Result<Hello> Hello::Decode(const uint8_t* buf) {
  Hello h;
  if (std::memcmp(buf, kHelloMagic, sizeof(kHelloMagic)) != 0) {
    return {h, Error::ConnectionSetupFailed};
  }

  h.version = buf[4];
  h.policy = static_cast<FirstMoverPolicy>(buf[5]);
  h.frame_size = GetU32BE(buf + 8);

  if (h.version != kHelloVersion) {
    return {h, Error::ConnectionSetupFailed};
  }
  if (buf[5] > static_cast<uint8_t>(FirstMoverPolicy::Acceptor)) {
    return {h, Error::ConnectionSetupFailed};
  }
  return {h, Error::OK};
}

}  // namespace tpn
