#include "test_framework.hpp"

#include "tpn/session.hpp"
#include "tpn/tcp_connection.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using tpn::Error;

TEST(TicketFormat) {
  ASSERT_TRUE(tpn::FormatTicket("127.0.0.1", 7000) == "127.0.0.1:7000");
  ASSERT_TRUE(tpn::FormatTicket("::1", 7000) == "[::1]:7000");
  ASSERT_TRUE(tpn::FormatTicket("game.example.net", 1) ==
              "game.example.net:1");
}

TEST(TicketParse) {
  auto v4 = tpn::ParseTicket("192.168.1.20:4242");
  ASSERT_TRUE(v4.ok());
  ASSERT_TRUE(v4.value.host == "192.168.1.20");
  ASSERT_EQ(v4.value.port, 4242);

  auto v6 = tpn::ParseTicket("[fe80::1]:65535");
  ASSERT_TRUE(v6.ok());
  ASSERT_TRUE(v6.value.host == "fe80::1");
  ASSERT_EQ(v6.value.port, 65535);

  auto name = tpn::ParseTicket("localhost:80");
  ASSERT_TRUE(name.ok());
  ASSERT_TRUE(name.value.host == "localhost");
}

TEST(TicketParseRejectsMalformed) {
  const char* bad[] = {
      "",          "localhost",   ":7000",        "host:",
      "host:abc",  "host:0",      "host:65536",   "host:123456",
      "::1:7000",  "[]:7000",     "[::1:7000",    "host:-1",
  };
  for (const char* ticket : bad) {
    ASSERT_EQ(tpn::ParseTicket(ticket).error, Error::InvalidConfig);
  }
}

TEST(TcpLoopbackExchange) {
  auto listener = tpn::TcpListener::Listen("127.0.0.1", 0);
  ASSERT_TRUE(listener.ok());
  ASSERT_TRUE(listener.value->Port() != 0);

  std::string ticket = listener.value->Ticket();
  ASSERT_TRUE(ticket == "127.0.0.1:" + std::to_string(listener.value->Port()));

  tpn::SessionConfig config;
  config.exchange_frame_size = true;

  tpn::Result<std::shared_ptr<tpn::Session>> host{nullptr, Error::OK};
  std::thread host_thread([&]() {
    auto conn = listener.value->Accept();
    ASSERT_TRUE(conn.ok());
    host = tpn::Session::Accept(std::move(conn.value), config);
  });

  auto conn = tpn::DialTicket(ticket);
  ASSERT_TRUE(conn.ok());
  auto joiner = tpn::Session::Initiate(std::move(conn.value), config);
  host_thread.join();

  ASSERT_TRUE(joiner.ok());
  ASSERT_TRUE(host.ok());

  // The joiner dialed, so it moves first
  ASSERT_TRUE(joiner.value->IsMyTurn());
  ASSERT_FALSE(host.value->IsMyTurn());

  for (uint8_t i = 0; i < 20; i++) {
    std::vector<uint8_t> move = {i, 1, static_cast<uint8_t>(i + 1), 2};
    ASSERT_EQ(joiner.value->Send(move), Error::OK);
    auto got = host.value->Receive();
    ASSERT_TRUE(got.ok());
    ASSERT_TRUE(got.value == move);

    std::reverse(move.begin(), move.end());
    ASSERT_EQ(host.value->Send(move), Error::OK);
    got = joiner.value->Receive();
    ASSERT_TRUE(got.ok());
    ASSERT_TRUE(got.value == move);
  }

  // Host leaves; the joiner notices instead of waiting forever
  host.value->Close();
  auto end = joiner.value->Receive();
  ASSERT_EQ(end.error, Error::TransportError);
  ASSERT_TRUE(joiner.value->IsClosed());
}

TEST(TcpCloseUnblocksRead) {
  auto listener = tpn::TcpListener::Listen("127.0.0.1", 0);
  ASSERT_TRUE(listener.ok());

  tpn::Result<std::unique_ptr<tpn::Connection>> accepted{nullptr, Error::OK};
  std::thread accept_thread([&]() { accepted = listener.value->Accept(); });
  auto conn = tpn::DialTicket(listener.value->Ticket());
  accept_thread.join();
  ASSERT_TRUE(conn.ok());
  ASSERT_TRUE(accepted.ok());

  // Nothing is ever written, so only Close can end this Read
  std::atomic<bool> done{false};
  tpn::Result<size_t> read{0, Error::OK};
  std::thread reader([&]() {
    uint8_t buf[16];
    read = conn.value->Read(buf, sizeof(buf));
    done = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ASSERT_FALSE(done.load());

  ASSERT_EQ(conn.value->Close(), Error::OK);
  reader.join();
  ASSERT_TRUE(!read.ok() || read.value == 0);
  ASSERT_TRUE(conn.value->IsClosed());

  uint8_t byte = 1;
  ASSERT_EQ(conn.value->Write(&byte, 1).error, Error::ConnectionClosed);
}

TEST(TcpDialRefused) {
  auto listener = tpn::TcpListener::Listen("127.0.0.1", 0);
  ASSERT_TRUE(listener.ok());
  uint16_t port = listener.value->Port();
  ASSERT_EQ(listener.value->Close(), Error::OK);

  auto conn = tpn::Dial("127.0.0.1", port);
  ASSERT_EQ(conn.error, Error::ConnectionSetupFailed);
  ASSERT_TRUE(conn.value == nullptr);

  ASSERT_EQ(tpn::DialTicket("not a ticket").error,
            Error::ConnectionSetupFailed);
}

TEST(TcpListenRejectsBadAddress) {
  auto listener = tpn::TcpListener::Listen("not-an-ip", 0);
  ASSERT_EQ(listener.error, Error::InvalidConfig);
}
