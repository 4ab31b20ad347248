#ifndef TPN_EXAMPLES_COMMON_CLI_HPP
#define TPN_EXAMPLES_COMMON_CLI_HPP

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "tpn/tpn.hpp"

namespace tpn_examples {

// Options shared by the example programs
struct Params {
  std::string mode = "host";
  std::string ticket;
  std::string bind = "0.0.0.0";
  uint16_t port = 0;
  std::string advertise;
  bool hello = true;
  std::string log_level = "warn";

  bool IsHost() const { return mode == "host"; }
};

inline void AddOptions(CLI::App& app, Params& params) {
  app.add_option("-m,--mode", params.mode, "host | join")
      ->check(CLI::IsMember({"host", "join"}))
      ->default_val(params.mode);
  app.add_option("-t,--ticket", params.ticket,
                 "Ticket printed by the host (join only)");
  app.add_option("-b,--bind", params.bind, "Address to listen on (host only)")
      ->default_val(params.bind);
  app.add_option("-p,--port", params.port, "Port to listen on, 0 for any")
      ->default_val(params.port);
  app.add_option("--advertise", params.advertise,
                 "Host name to put in the ticket (host only)");
  app.add_flag("--hello,!--no-hello", params.hello,
               "Check frame size and first-mover policy with the peer");
  app.add_option("-l,--log-level", params.log_level,
                 "Log level: trace | debug | info | warn | error | off")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}))
      ->default_val(params.log_level);
}

// Parse the command line and apply the log level. Exits on bad input.
inline void Parse(CLI::App& app, int argc, char** argv, Params& params) {
  try {
    app.parse(argc, argv);
    if (!params.IsHost() && params.ticket.empty()) {
      throw CLI::ValidationError("--ticket", "required when joining");
    }
  } catch (const CLI::ParseError& e) {
    std::exit(app.exit(e, std::cout, std::cerr));
  }

  tpn::LogLevel level = tpn::LogLevel::Warn;
  tpn::ParseLogLevel(params.log_level, &level);
  tpn::Logger::Instance().SetLevel(level);
}

// Host or join according to params and set up the session.
// Throws tpn::TpnError on failure.
inline std::shared_ptr<tpn::Session> Connect(const Params& params,
                                             tpn::SessionConfig config,
                                             const std::string& program) {
  config.exchange_frame_size = params.hello;

  if (params.IsHost()) {
    auto listener = tpn::TcpListener::Listen(params.bind, params.port);
    if (!listener.ok()) {
      throw tpn::TpnError(listener.error);
    }

    std::cout << "hosting game. another player may join with\n\n  "
              << program << " --mode join --ticket "
              << listener.value->Ticket(params.advertise) << "\n"
              << std::endl;

    auto conn = listener.value->Accept();
    if (!conn.ok()) {
      throw tpn::TpnError(conn.error);
    }
    listener.value->Close();

    auto session = tpn::Session::Accept(std::move(conn.value), config);
    if (!session.ok()) {
      throw tpn::TpnError(session.error);
    }
    return session.value;
  }

  auto conn = tpn::DialTicket(params.ticket);
  if (!conn.ok()) {
    throw tpn::TpnError(conn.error);
  }
  auto session = tpn::Session::Initiate(std::move(conn.value), config);
  if (!session.ok()) {
    throw tpn::TpnError(session.error);
  }
  return session.value;
}

}  // namespace tpn_examples

#endif  // TPN_EXAMPLES_COMMON_CLI_HPP
