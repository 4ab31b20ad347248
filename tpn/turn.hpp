#ifndef TPN_TURN_HPP
#define TPN_TURN_HPP

#include <cstdint>

#include "tpn/errors.hpp"
#include "tpn/types.hpp"

namespace tpn {

// Local turn automaton for one peer.
//
// The two peers each run one of these. They agree because every successful
// send on one side is matched by exactly one successful receive on the other;
// nothing about the turn is ever put on the wire.
//
// Receiving is split in two steps. A frame first arrives (read off the wire
// by the session's reader) and is held as pending; the turn only passes to us
// when the application takes delivery of it.
//
// Not thread-safe; Session guards it.
class TurnStateMachine {
 public:
  explicit TurnStateMachine(Role role);

  Turn Current() const { return turn_; }
  bool IsClosed() const { return turn_ == Turn::Closed; }

  // A frame has arrived but has not been delivered yet
  bool HasPendingFrame() const { return pending_; }

  // Number of turn transitions (sends plus deliveries) so far
  uint64_t TurnNumber() const { return transitions_; }

  // May we send now? OK, TurnViolation or SessionClosed. No state change.
  Error CheckSend() const;

  // A full frame was written. MyTurn -> OpponentsTurn.
  Error OnSent();

  // A full frame came off the wire.
  // Returns PeerTurnViolation if the peer could not have held the turn:
  // we hold it, or an earlier frame is still undelivered.
  Error OnFrameArrived();

  // The pending frame was handed to the application. OpponentsTurn -> MyTurn.
  Error OnFrameDelivered();

  // Enter the terminal state
  void Close();

 private:
  Turn turn_;
  bool pending_ = false;
  uint64_t transitions_ = 0;
};

}  // namespace tpn

#endif  // TPN_TURN_HPP
