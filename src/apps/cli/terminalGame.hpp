#pragma once

#include "core/game.hpp"

#include <iosfwd>

namespace ftf::cli {

//! Plays one game on a text terminal.
//! Every accepted move reaches the terminal through the engine's delta notification, which draws the board and,
//! once the game is over, the outcome.
class TerminalGame : public IGameStateListener {
public:
	TerminalGame(std::istream& in, std::ostream& out, GameConfig config);
	~TerminalGame() override;

	TerminalGame(const TerminalGame&)            = delete;
	TerminalGame& operator=(const TerminalGame&) = delete;

	//! Ask the players for moves until the game is over.
	//! \returns False if input ended or a player quit before the game was over.
	bool run();

	//! Play a fixed example game and print every position.
	void runDemo();

	const GameEngine& engine() const;

	void onGameDelta(const GameDelta& delta) override;

private:
	//! Prompt until the current player enters a well-formed coordinate.
	//! \returns False on end of input or quit command.
	bool readMove(Coord& coord);

	void printBoard(const GameDelta& delta); //!< Draw the area around the move.
	void printOutcome();                     //!< Announce winner or draw.

private:
	std::istream& m_in;
	std::ostream& m_out;
	GameEngine m_engine;
};

} // namespace ftf::cli
