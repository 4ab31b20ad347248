// Two-player board game in the terminal. The joining player moves first.
//
//   tpn_pieceboard --mode host
//   tpn_pieceboard --mode join --ticket 192.168.1.20:40123

#include <iostream>
#include <string>

#include "board.hpp"
#include "common/cli.hpp"

namespace {

using pieceboard::Board;
using pieceboard::Color;
using pieceboard::Move;

class Game {
 public:
  explicit Game(std::shared_ptr<tpn::Session> session)
      : session_(std::move(session)),
        me_(session_->GetRole() == tpn::Role::FirstMover ? Color::White
                                                         : Color::Black) {}

  void Run() {
    std::cout << "you play " << pieceboard::ColorString(me_) << std::endl;

    while (true) {
      std::cout << "\n" << board_.Render() << std::endl;

      bool keep_going = session_->IsMyTurn() ? PlayOurTurn() : AwaitTheirs();
      if (!keep_going) {
        break;
      }
    }

    std::cout << "white " << board_.Count(Color::White) << ", black "
              << board_.Count(Color::Black) << std::endl;
  }

 private:
  bool PlayOurTurn() {
    while (true) {
      std::cout << "your move (e.g. a2 a4), or quit: " << std::flush;

      std::string line;
      if (!std::getline(std::cin, line) || line == "quit") {
        return false;
      }

      Move move;
      if (!pieceboard::ParseMove(line, &move)) {
        std::cout << "could not read '" << line << "'" << std::endl;
        continue;
      }
      if (!board_.CanMove(me_, move)) {
        std::cout << "cannot play " << move.ToString() << " as "
                  << pieceboard::ColorString(me_) << std::endl;
        continue;
      }

      tpn::Error err = session_->Send(move.Encode());
      if (err != tpn::Error::OK) {
        throw tpn::TpnError(err);
      }
      board_.ApplyUnchecked(move);
      return true;
    }
  }

  bool AwaitTheirs() {
    std::cout << "waiting for the other player..." << std::endl;

    auto r = session_->Receive();
    if (r.error == tpn::Error::TransportError) {
      std::cout << "the other player left" << std::endl;
      return false;
    }
    if (!r.ok()) {
      throw tpn::TpnError(r.error);
    }

    Move move;
    if (!Move::Decode(r.value, &move) || !board_.ApplyUnchecked(move)) {
      std::cout << "the other player sent a move that does not fit this board"
                << std::endl;
      return false;
    }
    std::cout << "they played " << move.ToString() << std::endl;
    return true;
  }

  std::shared_ptr<tpn::Session> session_;
  Color me_;
  Board board_;
};

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"Move pieces on a shared board, one turn at a time"};
  tpn_examples::Params params;
  tpn_examples::AddOptions(app, params);
  tpn_examples::Parse(app, argc, argv, params);

  try {
    tpn::SessionConfig config;
    config.frame_size = pieceboard::kMoveSize;
    auto session = tpn_examples::Connect(params, config, argv[0]);

    Game game(session);
    game.Run();
    session->Close();
  } catch (const tpn::TpnError& e) {
    std::cerr << "pieceboard: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
