#ifndef TPN_TEST_MEMORY_CONNECTION_HPP
#define TPN_TEST_MEMORY_CONNECTION_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "tpn/connection.hpp"

namespace tpn_test {

// One direction of an in-memory byte pipe
class InMemoryEndpoint {
 public:
  bool Write(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return false;
    }
    data_.insert(data_.end(), data, data + len);
    cv_.notify_all();
    return true;
  }

  tpn::Result<size_t> Read(uint8_t* buf, size_t max_len,
                           int timeout_ms = 5000) {
    std::unique_lock<std::mutex> lock(mtx_);

    if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
          return !data_.empty() || closed_;
        })) {
      return {0, tpn::Error::Timeout};
    }

    // Buffered bytes are still delivered after close
    if (data_.empty()) {
      return {0, tpn::Error::EOF_};
    }

    size_t to_read = std::min(max_len, data_.size());
    std::copy(data_.begin(), data_.begin() + to_read, buf);
    data_.erase(data_.begin(), data_.begin() + to_read);
    return {to_read, tpn::Error::OK};
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    cv_.notify_all();
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<uint8_t> data_;
  bool closed_ = false;
};

// Connection over two endpoints that records what it writes
class InMemoryConnection : public tpn::Connection {
 public:
  InMemoryConnection(std::shared_ptr<InMemoryEndpoint> read_ep,
                     std::shared_ptr<InMemoryEndpoint> write_ep)
      : read_ep_(std::move(read_ep)), write_ep_(std::move(write_ep)) {}

  tpn::Result<size_t> Write(const uint8_t* data, size_t len) override {
    if (closed_) {
      return {0, tpn::Error::ConnectionClosed};
    }
    size_t n = std::min(len, max_write_chunk_.load());
    if (!write_ep_->Write(data, n)) {
      return {0, tpn::Error::ConnectionClosed};
    }
    write_calls_++;
    bytes_written_ += n;
    return {n, tpn::Error::OK};
  }

  tpn::Result<size_t> Read(uint8_t* buf, size_t max_len) override {
    if (closed_) {
      return {0, tpn::Error::ConnectionClosed};
    }
    return read_ep_->Read(buf, max_len);
  }

  tpn::Error Close() override {
    closed_ = true;
    read_ep_->Close();
    write_ep_->Close();
    return tpn::Error::OK;
  }

  bool IsClosed() const override { return closed_; }

  // Accept at most n bytes per Write call
  void SetMaxWriteChunk(size_t n) { max_write_chunk_ = n; }

  size_t WriteCalls() const { return write_calls_; }
  size_t BytesWritten() const { return bytes_written_; }

  // Write raw bytes as a misbehaving peer would
  bool WriteRaw(const std::vector<uint8_t>& bytes) {
    return Write(bytes.data(), bytes.size()).ok();
  }

 private:
  std::shared_ptr<InMemoryEndpoint> read_ep_;
  std::shared_ptr<InMemoryEndpoint> write_ep_;
  std::atomic<bool> closed_{false};
  std::atomic<size_t> max_write_chunk_{static_cast<size_t>(-1)};
  std::atomic<size_t> write_calls_{0};
  std::atomic<size_t> bytes_written_{0};
};

// Create a pair of connected in-memory connections (initiator, acceptor)
inline std::pair<std::unique_ptr<InMemoryConnection>,
                 std::unique_ptr<InMemoryConnection>>
MakeConnPair() {
  auto a_to_b = std::make_shared<InMemoryEndpoint>();
  auto b_to_a = std::make_shared<InMemoryEndpoint>();

  auto a = std::make_unique<InMemoryConnection>(b_to_a, a_to_b);
  auto b = std::make_unique<InMemoryConnection>(a_to_b, b_to_a);

  return {std::move(a), std::move(b)};
}

}  // namespace tpn_test

#endif  // TPN_TEST_MEMORY_CONNECTION_HPP
