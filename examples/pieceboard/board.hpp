#ifndef TPN_EXAMPLES_PIECEBOARD_BOARD_HPP
#define TPN_EXAMPLES_PIECEBOARD_BOARD_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pieceboard {

// Bytes per move on the wire
constexpr size_t kMoveSize = 4;

enum class Color : uint8_t {
  None,
  White,
  Black,
};

const char* ColorString(Color color);

// A tile: rank 1..8, file 'a'..'h'
struct Square {
  uint8_t rank = 0;
  char file = 0;

  bool Valid() const;
  bool operator==(const Square& o) const {
    return rank == o.rank && file == o.file;
  }
  bool operator!=(const Square& o) const { return !(*this == o); }
};

// Parse "e2"
bool ParseSquare(const std::string& text, Square* out);

struct Move {
  Square src;
  Square dst;

  // [src_rank, src_file, dst_rank, dst_file], files as ASCII letters
  std::vector<uint8_t> Encode() const;
  static bool Decode(const std::vector<uint8_t>& frame, Move* out);

  std::string ToString() const;
};

// Parse "a2 a4" (also "a2a4" and "a2-a4")
bool ParseMove(const std::string& text, Move* out);

// 8x8 board with white on ranks 1-2 and black on ranks 7-8.
// There are no rules beyond "a piece moves to a tile and takes whatever
// stood there".
class Board {
 public:
  Board();

  Color At(const Square& sq) const;

  // Whether `side` may play `move` from this position
  bool CanMove(Color side, const Move& move) const;

  // Apply without checking whose piece it is. Fails only if the move
  // names a tile off the board or an empty source tile.
  bool ApplyUnchecked(const Move& move);

  size_t Count(Color color) const;

  // Text diagram, rank 8 on top
  std::string Render() const;

 private:
  std::array<Color, 64> tiles_;

  static size_t Index(const Square& sq) {
    return (sq.rank - 1) * 8 + static_cast<size_t>(sq.file - 'a');
  }
};

}  // namespace pieceboard

#endif  // TPN_EXAMPLES_PIECEBOARD_BOARD_HPP
