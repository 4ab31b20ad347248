#include "tpn/turn.hpp"

namespace tpn {

TurnStateMachine::TurnStateMachine(Role role) : turn_(InitialTurn(role)) {}

Error TurnStateMachine::CheckSend() const {
  switch (turn_) {
    case Turn::MyTurn:
      return Error::OK;
    case Turn::OpponentsTurn:
      return Error::TurnViolation;
    default:
      return Error::SessionClosed;
  }
}

Error TurnStateMachine::OnSent() {
  Error err = CheckSend();
  if (err != Error::OK) {
    return err;
  }
  turn_ = Turn::OpponentsTurn;
  transitions_++;
  return Error::OK;
}

Error TurnStateMachine::OnFrameArrived() {
  if (turn_ == Turn::Closed) {
    return Error::SessionClosed;
  }
  if (turn_ == Turn::MyTurn || pending_) {
    return Error::PeerTurnViolation;
  }
  pending_ = true;
  return Error::OK;
}

Error TurnStateMachine::OnFrameDelivered() {
  if (turn_ == Turn::Closed) {
    return Error::SessionClosed;
  }
  if (!pending_) {
    return Error::NotReady;
  }
  pending_ = false;
  turn_ = Turn::MyTurn;
  transitions_++;
  return Error::OK;
}

void TurnStateMachine::Close() {
  turn_ = Turn::Closed;
  pending_ = false;
}

}  // namespace tpn
