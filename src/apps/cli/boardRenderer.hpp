#pragma once

#include "data/board.hpp"

#include <string>
#include <vector>

namespace ftf::cli {

//! Maximum number of rows and columns shown at once.
inline constexpr Id kMaxViewExtent = 41;

//! Character used to draw a mark.
inline constexpr char toSymbol(Mark mark) {
	return mark == Mark::PlayerOne ? 'x' : 'o';
}

//! Draw a window of the board in a frame. Highlighted cells are drawn in upper case.
//! Two marks of PlayerOne with a gap between them are drawn as:
//!     ⌜⎺⎺⎺⌝
//!     |x x|
//!     ⌞⎽⎽⎽⌟
std::string renderBoard(const Board& board, const Board::Bounds& view, const std::vector<Coord>& highlight = {});

//! Draw the extent of the board, clipped to the kMaxViewExtent rows and columns at its top left corner.
//! An empty board is drawn as an empty frame.
std::string renderBoard(const Board& board, const std::vector<Coord>& highlight = {});

//! Window of at most kMaxViewExtent rows and columns within the board extent, centered on focus where possible.
//! \note focus is expected to be an occupied cell.
Board::Bounds viewportAround(const Board& board, Coord focus);

} // namespace ftf::cli
