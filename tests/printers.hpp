#pragma once

#include "data/coordinate.hpp"
#include "data/gameStatus.hpp"
#include "data/mark.hpp"

#include <ostream>

// Readable gtest failure output for the board types.
namespace ftf {

inline void PrintTo(const Coord& c, std::ostream* os) {
	*os << "(" << c.row << ", " << c.col << ")";
}

inline void PrintTo(const Mark mark, std::ostream* os) {
	*os << toString(mark);
}

inline void PrintTo(const GameStatus status, std::ostream* os) {
	switch (status) {
	case GameStatus::InProgress:
		*os << "InProgress";
		break;
	case GameStatus::Won:
		*os << "Won";
		break;
	case GameStatus::Draw:
		*os << "Draw";
		break;
	}
}

} // namespace ftf
