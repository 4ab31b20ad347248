#ifndef TPN_ERRORS_HPP
#define TPN_ERRORS_HPP

#include <stdexcept>

namespace tpn {

// Error codes for tpn operations
enum class Error {
  OK = 0,
  // Session setup
  ConnectionSetupFailed,
  FrameSizeMismatch,
  InvalidConfig,
  // Turn protocol
  TurnViolation,
  PeerTurnViolation,
  // Framing
  InvalidFrameSize,
  TruncatedFrame,
  // Transport
  TransportError,
  ConnectionClosed,
  EOF_,
  ReadError,
  WriteError,
  // Session lifecycle
  SessionClosed,
  // Waiting
  Timeout,
  Canceled,
  NotReady,
};

// Broad category of an error code
enum class ErrorKind {
  None,
  ConnectionSetup,
  Config,
  TurnViolation,
  Framing,
  Transport,
  SessionClosed,
  Wait,
};

// Convert error to human-readable string
inline const char* ErrorString(Error err) {
  switch (err) {
    case Error::OK:
      return "ok";
    case Error::ConnectionSetupFailed:
      return "connection setup failed";
    case Error::FrameSizeMismatch:
      return "peer frame size mismatch";
    case Error::InvalidConfig:
      return "invalid configuration";
    case Error::TurnViolation:
      return "not our turn";
    case Error::PeerTurnViolation:
      return "peer sent out of turn";
    case Error::InvalidFrameSize:
      return "invalid frame size";
    case Error::TruncatedFrame:
      return "truncated frame";
    case Error::TransportError:
      return "transport error";
    case Error::ConnectionClosed:
      return "connection closed";
    case Error::EOF_:
      return "end of file";
    case Error::ReadError:
      return "read error";
    case Error::WriteError:
      return "write error";
    case Error::SessionClosed:
      return "session closed";
    case Error::Timeout:
      return "timeout";
    case Error::Canceled:
      return "operation canceled";
    case Error::NotReady:
      return "no frame ready";
    default:
      return "unknown error";
  }
}

inline ErrorKind KindOf(Error err) {
  switch (err) {
    case Error::OK:
      return ErrorKind::None;
    case Error::ConnectionSetupFailed:
    case Error::FrameSizeMismatch:
      return ErrorKind::ConnectionSetup;
    case Error::InvalidConfig:
      return ErrorKind::Config;
    case Error::TurnViolation:
    case Error::PeerTurnViolation:
      return ErrorKind::TurnViolation;
    case Error::InvalidFrameSize:
    case Error::TruncatedFrame:
      return ErrorKind::Framing;
    case Error::SessionClosed:
      return ErrorKind::SessionClosed;
    case Error::Timeout:
    case Error::Canceled:
    case Error::NotReady:
      return ErrorKind::Wait;
    default:
      return ErrorKind::Transport;
  }
}

// Whether an error observed on a live session closes it.
// Local caller mistakes (TurnViolation, InvalidFrameSize) and waits are not
// fatal; anything that makes the wire or the peer untrustworthy is.
inline bool IsFatal(Error err) {
  switch (err) {
    case Error::PeerTurnViolation:
    case Error::TruncatedFrame:
      return true;
    default:
      return KindOf(err) == ErrorKind::Transport;
  }
}

// Exception class for tpn errors
class TpnError : public std::runtime_error {
 public:
  explicit TpnError(Error code)
      : std::runtime_error(ErrorString(code)), code_(code) {}

  Error code() const noexcept { return code_; }

 private:
  Error code_;
};

// Result type for operations that return a value or error
template <typename T>
struct Result {
  T value;
  Error error;

  bool ok() const { return error == Error::OK; }

  // Implicit conversion for checking
  explicit operator bool() const { return ok(); }
};

// Specialization for void result
template <>
struct Result<void> {
  Error error;

  bool ok() const { return error == Error::OK; }
  explicit operator bool() const { return ok(); }

  static Result<void> Ok() { return {Error::OK}; }
  static Result<void> Err(Error e) { return {e}; }
};

}  // namespace tpn

#endif  // TPN_ERRORS_HPP
