#ifndef TPN_SESSION_HPP
#define TPN_SESSION_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "tpn/connection.hpp"
#include "tpn/errors.hpp"
#include "tpn/turn.hpp"
#include "tpn/types.hpp"

namespace tpn {

// Session configuration
struct SessionConfig {
  // Payload size N; both peers must agree on it
  size_t frame_size = kDefaultFrameSize;
  // Which side gets the first turn; both peers must agree on it
  FirstMoverPolicy first_mover = FirstMoverPolicy::Initiator;
  // Exchange a hello at setup to catch frame size / policy mismatches
  bool exchange_frame_size = false;
  size_t read_buffer_size = kDefaultReadBufferSize;
};

Error ValidateSessionConfig(const SessionConfig& config);

// A turn-passing session between exactly two peers over one connection.
//
// Exactly one peer holds the turn at any time. The holder may Send one frame
// of exactly FrameSize() bytes, which passes the turn to the peer; Receive
// blocks until the peer's frame arrives and hands the turn back.
//
// A background thread owns the read half of the connection. All methods are
// safe to call from any thread.
class Session {
 public:
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Create a session on a connection this peer dialed
  static Result<std::shared_ptr<Session>> Initiate(
      std::unique_ptr<Connection> conn, const SessionConfig& config = {});

  // Create a session on a connection this peer accepted
  static Result<std::shared_ptr<Session>> Accept(
      std::unique_ptr<Connection> conn, const SessionConfig& config = {});

  // Whose turn it is. Never blocks on I/O.
  Turn CurrentTurn() const;
  bool IsMyTurn() const { return CurrentTurn() == Turn::MyTurn; }

  Role GetRole() const { return role_; }
  Side GetSide() const { return side_; }
  size_t FrameSize() const { return config_.frame_size; }

  // Send our turn. Blocks until the whole frame is written.
  // Fails without touching the connection if the frame has the wrong size
  // (InvalidFrameSize) or it is not our turn (TurnViolation).
  Error Send(const uint8_t* data, size_t len);
  Error Send(const std::vector<uint8_t>& frame) {
    return Send(frame.data(), frame.size());
  }

  // Wait for the peer's turn. May be called while it is still our turn.
  // A frame the peer sent before disconnecting is still delivered; the
  // session is Closed after that, and the next call reports the cause.
  Result<std::vector<uint8_t>> Receive();

  // Receive with a bound. Returns Timeout with state unchanged.
  // Bounds too large to represent wait without limit.
  Result<std::vector<uint8_t>> ReceiveFor(std::chrono::milliseconds timeout);

  // Take the peer's turn if it has arrived, otherwise return NotReady
  Result<std::vector<uint8_t>> TryReceive();

  // Wake every pending Receive with Canceled. Nothing is lost: a frame still
  // in flight stays buffered and is delivered by the next Receive.
  void CancelReceive();

  // Close the session and the connection (idempotent)
  Error Close();

  bool IsClosed() const;

  // Why the session closed: OK after Close() or while open
  Error GetError() const;

  uint64_t FramesSent() const;
  uint64_t FramesReceived() const;

 private:
  Session(std::unique_ptr<Connection> conn, Side side, Role role,
          const SessionConfig& config);

  static Result<std::shared_ptr<Session>> Create(
      std::unique_ptr<Connection> conn, Side side, const SessionConfig& config);

  // Start the read loop (called after construction)
  void Start();

  // Background read loop
  void ReadLoop();

  // Hand a complete frame from the wire to the turn machine
  Error AdmitFrame(std::vector<uint8_t> frame);

  Result<std::vector<uint8_t>> ReceiveUntil(
      std::optional<std::chrono::steady_clock::time_point> deadline);

  // Deliver the pending frame (state_mtx_ held)
  Result<std::vector<uint8_t>> DeliverLocked();

  // Error for an operation on a closed session (state_mtx_ held).
  // The recorded cause is reported once, then SessionClosed.
  Error ClosedErrorLocked();

  // Move to Closed, record the cause and release the connection.
  // Returns false if the session was already closed.
  bool CloseWithError(Error cause);

  // State half of CloseWithError (state_mtx_ held)
  bool CloseLocked(Error cause);

  // The stream ended between frames. A frame still waiting for delivery is
  // kept; the session closes with `cause` once it has been delivered.
  void OnStreamEnd(Error cause);

  std::unique_ptr<Connection> conn_;
  Side side_;
  Role role_;
  SessionConfig config_;

  // Serializes frame writes with frame admission
  std::mutex write_mtx_;

  // Turn state, inbox and close cause
  mutable std::mutex state_mtx_;
  std::condition_variable recv_cv_;
  TurnStateMachine turn_;
  std::vector<uint8_t> inbox_;
  uint64_t cancel_generation_ = 0;
  Error close_error_ = Error::OK;
  // Set when the peer is gone but its last frame is undelivered
  Error drain_error_ = Error::OK;
  bool close_reported_ = false;
  uint64_t frames_sent_ = 0;
  uint64_t frames_received_ = 0;

  std::thread read_thread_;
};

}  // namespace tpn

#endif  // TPN_SESSION_HPP
