#pragma once

#include "data/coordinate.hpp"
#include "data/gameStatus.hpp"
#include "data/mark.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ftf {

//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< A mark was placed.
	GS_PlayerChange = 1 << 1, //!< Mark to move changed.
	GS_StateChange  = 1 << 2, //!< Game finished. Won or drawn.
};

//! Symbolises the game state change after one accepted move.
struct GameDelta {
	std::size_t moveId;             //!< Move number, starting at 1.
	Mark mark;                      //!< Mark that was placed.
	Coord coord;                    //!< Where the mark was placed.
	Mark nextMark;                  //!< Mark to move next. Equals mark once the game is over.
	GameStatus status;              //!< Game status after the move.
	std::vector<Coord> winningLine; //!< Winning window if the move won the game.
};

} // namespace ftf
