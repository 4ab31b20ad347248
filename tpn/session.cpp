#include "tpn/session.hpp"

#include "tpn/frame.hpp"
#include "tpn/log.hpp"
#include "tpn/role.hpp"

namespace tpn {

Error ValidateSessionConfig(const SessionConfig& config) {
  Error err = ValidateFrameSizeConfig(config.frame_size);
  if (err != Error::OK) {
    return err;
  }
  if (config.read_buffer_size == 0) {
    return Error::InvalidConfig;
  }
  return Error::OK;
}

Session::Session(std::unique_ptr<Connection> conn, Side side, Role role,
                 const SessionConfig& config)
    : conn_(std::move(conn)),
      side_(side),
      role_(role),
      config_(config),
      turn_(role) {}

Session::~Session() {
  Close();

  // Close() unblocks the reader's pending Read, so this returns promptly
  if (read_thread_.joinable()) {
    read_thread_.join();
  }
}

Result<std::shared_ptr<Session>> Session::Initiate(
    std::unique_ptr<Connection> conn, const SessionConfig& config) {
  return Create(std::move(conn), Side::Initiator, config);
}

Result<std::shared_ptr<Session>> Session::Accept(
    std::unique_ptr<Connection> conn, const SessionConfig& config) {
  return Create(std::move(conn), Side::Acceptor, config);
}

Result<std::shared_ptr<Session>> Session::Create(
    std::unique_ptr<Connection> conn, Side side, const SessionConfig& config) {
  Error err = ValidateSessionConfig(config);
  if (err != Error::OK) {
    TPN_LOG_ERROR << "session: invalid config (frame_size="
                  << config.frame_size << ")";
    return {nullptr, err};
  }

  if (!conn) {
    return {nullptr, Error::ConnectionSetupFailed};
  }

  NegotiationOptions options;
  options.frame_size = config.frame_size;
  options.first_mover = config.first_mover;
  options.exchange_hello = config.exchange_frame_size;

  auto role = Negotiate(*conn, side, options);
  if (!role.ok()) {
    conn->Close();
    return {nullptr, role.error};
  }

  auto session = std::shared_ptr<Session>(
      new Session(std::move(conn), side, role.value, config));
  session->Start();

  TPN_LOG_INFO << "session: established as " << SideString(side) << ", "
               << RoleString(role.value) << ", frame size "
               << config.frame_size;
  return {session, Error::OK};
}

void Session::Start() {
  read_thread_ = std::thread([this]() { ReadLoop(); });
}

Turn Session::CurrentTurn() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return turn_.Current();
}

Error Session::Send(const uint8_t* data, size_t len) {
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (turn_.IsClosed()) {
      return ClosedErrorLocked();
    }
  }

  Error err = ValidateFrameSize(len, config_.frame_size);
  if (err != Error::OK) {
    TPN_LOG_DEBUG << "send: rejected " << len << " byte frame, expected "
                  << config_.frame_size;
    return err;
  }

  std::lock_guard<std::mutex> write_lock(write_mtx_);

  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    err = turn_.CheckSend();
    if (err == Error::SessionClosed) {
      return ClosedErrorLocked();
    }
    if (err != Error::OK) {
      TPN_LOG_DEBUG << "send: rejected, " << TurnString(turn_.Current());
      return err;
    }
  }

  err = WriteFull(*conn_, data, len);
  if (err != Error::OK) {
    CloseWithError(err);
    std::lock_guard<std::mutex> lock(state_mtx_);
    return ClosedErrorLocked();
  }

  std::lock_guard<std::mutex> lock(state_mtx_);
  if (turn_.OnSent() != Error::OK) {
    // Closed while the frame was being written
    return ClosedErrorLocked();
  }
  frames_sent_++;
  TPN_LOG_DEBUG << "send: frame " << frames_sent_ << " written, now "
                << TurnString(turn_.Current());
  return Error::OK;
}

Result<std::vector<uint8_t>> Session::Receive() {
  return ReceiveUntil(std::nullopt);
}

Result<std::vector<uint8_t>> Session::ReceiveFor(
    std::chrono::milliseconds timeout) {
  auto now = std::chrono::steady_clock::now();
  auto max_wait = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::time_point::max() - now);
  if (timeout >= max_wait) {
    return ReceiveUntil(std::nullopt);
  }
  return ReceiveUntil(now + timeout);
}

Result<std::vector<uint8_t>> Session::TryReceive() {
  std::lock_guard<std::mutex> lock(state_mtx_);
  if (turn_.IsClosed()) {
    return {{}, ClosedErrorLocked()};
  }
  if (!turn_.HasPendingFrame()) {
    return {{}, Error::NotReady};
  }
  return DeliverLocked();
}

Result<std::vector<uint8_t>> Session::ReceiveUntil(
    std::optional<std::chrono::steady_clock::time_point> deadline) {
  std::unique_lock<std::mutex> lock(state_mtx_);

  uint64_t generation = cancel_generation_;
  auto ready = [this, generation]() {
    return turn_.HasPendingFrame() || turn_.IsClosed() ||
           cancel_generation_ != generation;
  };

  if (deadline) {
    if (!recv_cv_.wait_until(lock, *deadline, ready)) {
      return {{}, Error::Timeout};
    }
  } else {
    recv_cv_.wait(lock, ready);
  }

  if (turn_.IsClosed()) {
    return {{}, ClosedErrorLocked()};
  }
  if (!turn_.HasPendingFrame()) {
    return {{}, Error::Canceled};
  }
  return DeliverLocked();
}

Result<std::vector<uint8_t>> Session::DeliverLocked() {
  Error err = turn_.OnFrameDelivered();
  if (err != Error::OK) {
    return {{}, err};
  }

  std::vector<uint8_t> frame = std::move(inbox_);
  inbox_.clear();
  frames_received_++;
  TPN_LOG_DEBUG << "receive: frame " << frames_received_ << " delivered, now "
                << TurnString(turn_.Current());

  if (drain_error_ != Error::OK) {
    // That was the peer's last frame; the connection is already closed
    CloseLocked(drain_error_);
    recv_cv_.notify_all();
  }
  return {std::move(frame), Error::OK};
}

void Session::CancelReceive() {
  std::lock_guard<std::mutex> lock(state_mtx_);
  cancel_generation_++;
  recv_cv_.notify_all();
}

Error Session::Close() {
  CloseWithError(Error::OK);
  return Error::OK;
}

bool Session::IsClosed() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return turn_.IsClosed();
}

Error Session::GetError() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return close_error_;
}

uint64_t Session::FramesSent() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return frames_sent_;
}

uint64_t Session::FramesReceived() const {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return frames_received_;
}

Error Session::ClosedErrorLocked() {
  if (close_error_ != Error::OK && !close_reported_) {
    close_reported_ = true;
    return close_error_;
  }
  return Error::SessionClosed;
}

bool Session::CloseWithError(Error cause) {
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (!CloseLocked(cause)) {
      return false;
    }
  }

  conn_->Close();
  recv_cv_.notify_all();
  return true;
}

bool Session::CloseLocked(Error cause) {
  if (turn_.IsClosed()) {
    return false;
  }
  turn_.Close();
  close_error_ = cause;
  drain_error_ = Error::OK;
  inbox_.clear();

  if (cause == Error::OK) {
    TPN_LOG_INFO << "session: closed";
  } else {
    TPN_LOG_WARN << "session: closed, " << ErrorString(cause);
  }
  return true;
}

void Session::OnStreamEnd(Error cause) {
  bool keep_frame = false;
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (turn_.IsClosed()) {
      return;
    }
    if (turn_.HasPendingFrame()) {
      drain_error_ = cause;
      keep_frame = true;
      TPN_LOG_INFO << "session: peer gone (" << ErrorString(cause)
                   << "), last frame awaits delivery";
    }
  }

  if (keep_frame) {
    conn_->Close();
    return;
  }
  CloseWithError(cause);
}

void Session::ReadLoop() {
  std::vector<uint8_t> buf(config_.read_buffer_size);
  FrameReader reader(config_.frame_size);

  while (!IsClosed()) {
    auto result = conn_->Read(buf.data(), buf.size());
    if (result.error == Error::Timeout) {
      continue;  // Retry on timeout
    }

    if (result.error != Error::OK || result.value == 0) {
      // A stream that ends between frames is a disconnect; inside one it
      // leaves the byte position unrecoverable
      if (reader.Buffered() > 0) {
        CloseWithError(Error::TruncatedFrame);
      } else {
        OnStreamEnd(Error::TransportError);
      }
      return;
    }

    size_t offset = 0;
    while (offset < result.value) {
      offset += reader.Feed(buf.data() + offset, result.value - offset);

      if (reader.HasFrame()) {
        Error err = AdmitFrame(reader.TakeFrame());
        if (err != Error::OK) {
          CloseWithError(err);
          return;
        }
      }
    }
  }
}

Error Session::AdmitFrame(std::vector<uint8_t> frame) {
  // A Send still writing must apply its transition before we judge the frame
  std::lock_guard<std::mutex> write_lock(write_mtx_);
  std::lock_guard<std::mutex> lock(state_mtx_);

  Error err = turn_.OnFrameArrived();
  if (err != Error::OK) {
    if (err == Error::PeerTurnViolation) {
      TPN_LOG_WARN << "receive: peer sent while "
                   << (turn_.HasPendingFrame() ? "a frame was undelivered"
                                               : "we held the turn");
    }
    return err;
  }

  inbox_ = std::move(frame);
  TPN_LOG_TRACE << "receive: frame arrived (" << inbox_.size() << " bytes)";
  recv_cv_.notify_all();
  return Error::OK;
}

}  // namespace tpn
