#ifndef TPN_TYPES_HPP
#define TPN_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace tpn {

// Default frame size in bytes (one board move: src rank/file, dst rank/file)
constexpr size_t kDefaultFrameSize = 4;

// Maximum frame size
constexpr size_t kMaxFrameSize = 1024 * 1024; // 1 MiB

// Default size of the reader thread's receive buffer
constexpr size_t kDefaultReadBufferSize = 4096;

// Negotiation hello: magic(4) version(1) policy(1) reserved(2) frame_size(4)
constexpr size_t kHelloSize = 12;
constexpr uint8_t kHelloVersion = 1;
constexpr uint8_t kHelloMagic[4] = {'T', 'P', 'N', 'H'};

// Which end of the transport this peer is
enum class Side : uint8_t {
  Initiator = 0, // Dialed the connection
  Acceptor = 1,  // Accepted the connection
};

// Which side of the transport is handed the first turn.
// Both peers must be configured with the same policy.
enum class FirstMoverPolicy : uint8_t {
  Initiator = 0,
  Acceptor = 1,
};

// Role assigned once per session
enum class Role : uint8_t {
  FirstMover,
  SecondMover,
};

// Turn states
enum class Turn {
  MyTurn,        // We hold the turn and may send
  OpponentsTurn, // Waiting for the peer's frame
  Closed,        // Terminal
};

inline const char *SideString(Side side) {
  switch (side) {
  case Side::Initiator:
    return "Initiator";
  case Side::Acceptor:
    return "Acceptor";
  default:
    return "Unknown";
  }
}

inline const char *RoleString(Role role) {
  switch (role) {
  case Role::FirstMover:
    return "FirstMover";
  case Role::SecondMover:
    return "SecondMover";
  default:
    return "Unknown";
  }
}

// Convert turn state to string for debugging
inline const char *TurnString(Turn turn) {
  switch (turn) {
  case Turn::MyTurn:
    return "MyTurn";
  case Turn::OpponentsTurn:
    return "OpponentsTurn";
  case Turn::Closed:
    return "Closed";
  default:
    return "Unknown";
  }
}

// The turn a role starts with
inline Turn InitialTurn(Role role) {
  return role == Role::FirstMover ? Turn::MyTurn : Turn::OpponentsTurn;
}

} // namespace tpn

#endif // TPN_TYPES_HPP
