#include "test_framework.hpp"

#include "tpn/turn.hpp"

using tpn::Error;
using tpn::Role;
using tpn::Turn;
using tpn::TurnStateMachine;

TEST(TurnInitialState) {
  ASSERT_EQ(TurnStateMachine(Role::FirstMover).Current(), Turn::MyTurn);
  ASSERT_EQ(TurnStateMachine(Role::SecondMover).Current(),
            Turn::OpponentsTurn);
}

TEST(TurnSendOutOfTurn) {
  TurnStateMachine m(Role::SecondMover);
  ASSERT_EQ(m.CheckSend(), Error::TurnViolation);
  ASSERT_EQ(m.OnSent(), Error::TurnViolation);
  ASSERT_EQ(m.Current(), Turn::OpponentsTurn);
  ASSERT_EQ(m.TurnNumber(), 0u);
}

TEST(TurnFullCycle) {
  TurnStateMachine m(Role::FirstMover);

  ASSERT_EQ(m.CheckSend(), Error::OK);
  ASSERT_EQ(m.OnSent(), Error::OK);
  ASSERT_EQ(m.Current(), Turn::OpponentsTurn);

  ASSERT_EQ(m.OnFrameArrived(), Error::OK);
  ASSERT_TRUE(m.HasPendingFrame());
  // The turn passes only on delivery
  ASSERT_EQ(m.Current(), Turn::OpponentsTurn);
  ASSERT_EQ(m.CheckSend(), Error::TurnViolation);

  ASSERT_EQ(m.OnFrameDelivered(), Error::OK);
  ASSERT_FALSE(m.HasPendingFrame());
  ASSERT_EQ(m.Current(), Turn::MyTurn);
  ASSERT_EQ(m.TurnNumber(), 2u);
}

TEST(TurnDeliverWithoutFrame) {
  TurnStateMachine m(Role::SecondMover);
  ASSERT_EQ(m.OnFrameDelivered(), Error::NotReady);
  ASSERT_EQ(m.Current(), Turn::OpponentsTurn);
}

TEST(TurnPeerSendsDuringOurTurn) {
  TurnStateMachine m(Role::FirstMover);
  ASSERT_EQ(m.OnFrameArrived(), Error::PeerTurnViolation);
}

TEST(TurnPeerSendsTwice) {
  TurnStateMachine m(Role::SecondMover);
  ASSERT_EQ(m.OnFrameArrived(), Error::OK);
  ASSERT_EQ(m.OnFrameArrived(), Error::PeerTurnViolation);
}

TEST(TurnClosedIsTerminal) {
  TurnStateMachine m(Role::SecondMover);
  ASSERT_EQ(m.OnFrameArrived(), Error::OK);
  m.Close();

  ASSERT_TRUE(m.IsClosed());
  ASSERT_FALSE(m.HasPendingFrame());
  ASSERT_EQ(m.CheckSend(), Error::SessionClosed);
  ASSERT_EQ(m.OnSent(), Error::SessionClosed);
  ASSERT_EQ(m.OnFrameArrived(), Error::SessionClosed);
  ASSERT_EQ(m.OnFrameDelivered(), Error::SessionClosed);
  ASSERT_EQ(m.Current(), Turn::Closed);
}

TEST(TurnMirrorsStayInSync) {
  // Two machines driven only by each other's successful I/O
  TurnStateMachine a(Role::FirstMover);
  TurnStateMachine b(Role::SecondMover);

  for (int i = 0; i < 100; i++) {
    TurnStateMachine& sender = (i % 2 == 0) ? a : b;
    TurnStateMachine& receiver = (i % 2 == 0) ? b : a;

    ASSERT_EQ(sender.Current(), Turn::MyTurn);
    ASSERT_EQ(receiver.Current(), Turn::OpponentsTurn);
    ASSERT_EQ(receiver.CheckSend(), Error::TurnViolation);

    ASSERT_EQ(sender.OnSent(), Error::OK);
    ASSERT_EQ(receiver.OnFrameArrived(), Error::OK);
    ASSERT_EQ(receiver.OnFrameDelivered(), Error::OK);

    // Never both, never neither
    ASSERT_TRUE((a.Current() == Turn::MyTurn) !=
                (b.Current() == Turn::MyTurn));
  }

  ASSERT_EQ(a.TurnNumber(), 100u);
  ASSERT_EQ(b.TurnNumber(), 100u);
}
