#pragma once

#include "data/board.hpp"

#include <array>
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace ftf {

//! Unit step along a line on the board.
struct Direction {
	int dRow, dCol;
};

//! Line directions checked for a win: horizontal, vertical, diagonal, anti-diagonal.
inline constexpr std::array<Direction, 4> kDirections{{{0, 1}, {1, 0}, {1, 1}, {1, -1}}};

//! Number of contiguous marks that win the game.
inline constexpr std::size_t kWinLength = 5u;

//! Reverse of a direction.
inline constexpr Direction reversed(Direction d) {
	return {-d.dRow, -d.dCol};
}

//! Neighbour of c in direction d. Empty if the neighbour is outside of the Id range.
std::optional<Coord> step(Coord c, Direction d);

//! Count the marks of the given player directly following origin in direction d.
//! Stops at the first cell that is empty or owned by the opponent, or after limit cells.
//! \note The origin cell itself is not counted.
std::size_t countDirection(const Board& board, Coord origin, Mark mark, Direction d,
                           std::size_t limit = std::numeric_limits<std::size_t>::max());

//! Check whether the mark just placed at origin completes a line of kWinLength.
//! Only the four lines through origin are scanned, at most kWinLength-1 cells to each side.
//! \returns The winning window of exactly kWinLength cells, ordered along the direction. The window
//!          starts at the backward end of the scanned run and always contains origin.
std::optional<std::vector<Coord>> findWinningLine(const Board& board, Coord origin, Mark mark);

//! Full run of same marks through origin along d, ordered along d. Empty if origin is free.
std::vector<Coord> lineThrough(const Board& board, Coord origin, Direction d);

//! Longest of the runs through origin over all kDirections.
std::vector<Coord> longestLine(const Board& board, Coord origin);

} // namespace ftf
