#pragma once

namespace ftf {

enum class GameStatus {
	InProgress, //!< Moves are accepted.
	Won,        //!< A player completed a line of five.
	Draw        //!< Move limit reached without a winner.
};

} // namespace ftf
