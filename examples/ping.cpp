// Connect two peers and report the roles they were given. Nothing is sent.
//
//   tpn_ping --mode host
//   tpn_ping --mode join --ticket 127.0.0.1:40123

#include <chrono>
#include <iostream>
#include <thread>

#include "common/cli.hpp"

int main(int argc, char** argv) {
  CLI::App app{"Establish a turn-passing session and hold it open"};
  tpn_examples::Params params;
  int hold_ms = 1000;

  tpn_examples::AddOptions(app, params);
  app.add_option("--hold-ms", hold_ms, "How long to keep the session open")
      ->check(CLI::NonNegativeNumber)
      ->default_val(hold_ms);
  tpn_examples::Parse(app, argc, argv, params);

  try {
    auto session = tpn_examples::Connect(params, tpn::SessionConfig{}, argv[0]);
    std::cout << "connected as " << tpn::SideString(session->GetSide())
              << ", " << tpn::RoleString(session->GetRole()) << ", "
              << tpn::TurnString(session->CurrentTurn()) << std::endl;

    std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
    session->Close();
  } catch (const tpn::TpnError& e) {
    std::cerr << "ping: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
