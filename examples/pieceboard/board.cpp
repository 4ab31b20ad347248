#include "board.hpp"

#include <algorithm>
#include <cctype>

namespace pieceboard {

const char* ColorString(Color color) {
  switch (color) {
    case Color::White:
      return "white";
    case Color::Black:
      return "black";
    default:
      return "none";
  }
}

bool Square::Valid() const {
  return rank >= 1 && rank <= 8 && file >= 'a' && file <= 'h';
}

bool ParseSquare(const std::string& text, Square* out) {
  if (text.size() != 2) {
    return false;
  }
  Square sq;
  sq.file = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
  if (text[1] < '1' || text[1] > '8') {
    return false;
  }
  sq.rank = static_cast<uint8_t>(text[1] - '0');
  if (!sq.Valid()) {
    return false;
  }
  *out = sq;
  return true;
}

std::vector<uint8_t> Move::Encode() const {
  return {src.rank, static_cast<uint8_t>(src.file), dst.rank,
          static_cast<uint8_t>(dst.file)};
}

bool Move::Decode(const std::vector<uint8_t>& frame, Move* out) {
  if (frame.size() != kMoveSize) {
    return false;
  }
  Move m;
  m.src.rank = frame[0];
  m.src.file = static_cast<char>(frame[1]);
  m.dst.rank = frame[2];
  m.dst.file = static_cast<char>(frame[3]);
  if (!m.src.Valid() || !m.dst.Valid()) {
    return false;
  }
  *out = m;
  return true;
}

std::string Move::ToString() const {
  std::string s;
  s += src.file;
  s += static_cast<char>('0' + src.rank);
  s += ' ';
  s += dst.file;
  s += static_cast<char>('0' + dst.rank);
  return s;
}

bool ParseMove(const std::string& text, Move* out) {
  std::string squares;
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c)) && c != '-') {
      squares += c;
    }
  }
  if (squares.size() != 4) {
    return false;
  }

  Move m;
  if (!ParseSquare(squares.substr(0, 2), &m.src) ||
      !ParseSquare(squares.substr(2, 2), &m.dst)) {
    return false;
  }
  *out = m;
  return true;
}

Board::Board() {
  tiles_.fill(Color::None);
  for (char file = 'a'; file <= 'h'; file++) {
    for (uint8_t rank : {1, 2}) {
      tiles_[Index({rank, file})] = Color::White;
    }
    for (uint8_t rank : {7, 8}) {
      tiles_[Index({rank, file})] = Color::Black;
    }
  }
}

Color Board::At(const Square& sq) const {
  if (!sq.Valid()) {
    return Color::None;
  }
  return tiles_[Index(sq)];
}

bool Board::CanMove(Color side, const Move& move) const {
  if (!move.src.Valid() || !move.dst.Valid() || move.src == move.dst) {
    return false;
  }
  return side != Color::None && At(move.src) == side;
}

bool Board::ApplyUnchecked(const Move& move) {
  if (!move.src.Valid() || !move.dst.Valid()) {
    return false;
  }
  Color piece = tiles_[Index(move.src)];
  if (piece == Color::None) {
    return false;
  }
  tiles_[Index(move.src)] = Color::None;
  tiles_[Index(move.dst)] = piece;
  return true;
}

size_t Board::Count(Color color) const {
  return static_cast<size_t>(std::count(tiles_.begin(), tiles_.end(), color));
}

std::string Board::Render() const {
  std::string out;
  for (uint8_t rank = 8; rank >= 1; rank--) {
    out += static_cast<char>('0' + rank);
    out += ' ';
    for (char file = 'a'; file <= 'h'; file++) {
      switch (tiles_[Index({rank, file})]) {
        case Color::White:
          out += " W";
          break;
        case Color::Black:
          out += " B";
          break;
        default:
          out += " .";
          break;
      }
    }
    out += '\n';
  }
  out += "   a b c d e f g h\n";
  return out;
}

}  // namespace pieceboard
