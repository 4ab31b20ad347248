// Send a ping/pong, then echo a counter back and forth.
//
//   tpn_ping_echo --mode host
//   tpn_ping_echo --mode join --ticket 127.0.0.1:40123

#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "common/cli.hpp"

namespace {

// Poll for the peer's turn the way a game loop would
tpn::Result<std::vector<uint8_t>> WaitForTurn(tpn::Session& session) {
  while (true) {
    auto r = session.TryReceive();
    if (r.error != tpn::Error::NotReady) {
      return r;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

void Check(tpn::Error err) {
  if (err != tpn::Error::OK) {
    throw tpn::TpnError(err);
  }
}

std::vector<uint8_t> Expect(tpn::Session& session) {
  auto r = WaitForTurn(session);
  Check(r.error);
  return r.value;
}

std::string Show(const std::vector<uint8_t>& frame) {
  std::string out = "[";
  for (size_t i = 0; i < frame.size(); i++) {
    out += (i ? ", " : "") + std::to_string(frame[i]);
  }
  return out + "]";
}

std::vector<uint8_t> Text(const char* s) {
  return std::vector<uint8_t>(s, s + std::strlen(s));
}

void RunJoiner(tpn::Session& session, uint32_t rounds) {
  Check(session.Send(Text("ping")));
  std::cout << "client sent ping" << std::endl;

  if (Expect(session) != Text("pong")) {
    throw std::runtime_error("expected pong");
  }
  std::cout << "client received pong" << std::endl;

  for (uint32_t counter = 0; counter < rounds; counter++) {
    std::vector<uint8_t> bytes = {
        static_cast<uint8_t>(counter >> 24), static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8), static_cast<uint8_t>(counter)};
    Check(session.Send(bytes));
    std::cout << "client sent " << Show(bytes) << std::endl;

    if (Expect(session) != bytes) {
      throw std::runtime_error("echo does not match");
    }
    std::cout << "client got " << Show(bytes) << " back" << std::endl;
  }
}

void RunHost(tpn::Session& session, int delay_ms) {
  if (Expect(session) != Text("ping")) {
    throw std::runtime_error("expected ping");
  }
  std::cout << "server received ping" << std::endl;

  Check(session.Send(Text("pong")));
  std::cout << "server sent pong" << std::endl;

  while (true) {
    auto r = WaitForTurn(session);
    if (r.error == tpn::Error::TransportError) {
      std::cout << "client left after " << session.FramesReceived()
                << " frames" << std::endl;
      return;
    }
    Check(r.error);
    std::cout << "server received " << Show(r.value) << std::endl;

    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    Check(session.Send(r.value));
    std::cout << "server echoed" << std::endl;
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"Ping/pong, then echo a counter over a turn-passing session"};
  tpn_examples::Params params;
  uint32_t rounds = 10;
  int delay_ms = 250;

  tpn_examples::AddOptions(app, params);
  app.add_option("-r,--rounds", rounds, "Counter frames the client sends")
      ->default_val(rounds);
  app.add_option("--delay-ms", delay_ms, "Server pause before each echo")
      ->check(CLI::NonNegativeNumber)
      ->default_val(delay_ms);
  tpn_examples::Parse(app, argc, argv, params);

  try {
    // "ping", "pong" and the counter are all 4 bytes
    tpn::SessionConfig config;
    config.frame_size = 4;
    auto session = tpn_examples::Connect(params, config, argv[0]);

    if (params.IsHost()) {
      RunHost(*session, delay_ms);
    } else {
      RunJoiner(*session, rounds);
    }
    session->Close();
  } catch (const tpn::TpnError& e) {
    std::cerr << "ping_echo: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ping_echo: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
