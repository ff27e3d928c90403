#pragma once

#include "core/eventHub.hpp"
#include "core/gameEvent.hpp"
#include "data/board.hpp"
#include "data/gameStatus.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace ftf {

//! Rule settings of a game.
struct GameConfig {
	std::size_t maxMoves{0}; //!< Game is drawn after this many moves without a winner. 0 means no limit.
};

//! Reasons for a move to be rejected.
enum class MoveError {
	CellOccupied,   //!< Target cell already holds a mark.
	GameAlreadyOver //!< Game was already won or drawn.
};

//! Snapshot of the game state.
struct GameState {
	GameStatus status{GameStatus::InProgress}; //!< Whether the game is still running.
	Mark currentMark{Mark::PlayerOne};         //!< Mark to move. Frozen once the game is over.
	std::optional<Mark> winner{};              //!< Set once the game is won.
	std::vector<Coord> winningLine{};          //!< Five contiguous winning cells, ordered along their line.
	std::size_t moveCount{0};                  //!< Number of accepted moves.
};

//! Outcome of a move request.
struct MoveResult {
	std::optional<MoveError> error; //!< Why the move was rejected. Empty for accepted moves.
	GameState state;                //!< State after handling the move.

	bool accepted() const { return !error.has_value(); }
};

//! Rules engine of a single game of first to five.
//! Validates moves, places marks and detects the end of the game.
//! \note All public functions are safe to call from multiple threads.
//!       Listeners see every accepted move exactly once and in move order, after the move has been fully evaluated
//!       and with no engine lock held. Delivery runs on the thread of the playMove call that started it; a move made
//!       while another call is delivering is handed to that call, so its playMove may return before listeners ran.
class GameEngine {
public:
	//! Setup an empty board with PlayerOne to move.
	explicit GameEngine(GameConfig config = {});

	//! Current player places a mark at the given coordinate.
	//! A rejected move leaves the game untouched.
	MoveResult playMove(Coord c);

	//! Board data for rendering.
	//! \note The reference is not synchronized with concurrent playMove calls.
	const Board& board() const;

	Mark currentMark() const;               //!< Returns the mark to move.
	GameStatus status() const;              //!< Returns the game status.
	bool isOver() const;                    //!< True once the game is won or drawn.
	std::optional<Mark> winner() const;     //!< Returns the winner if there is one.
	std::vector<Coord> winningLine() const; //!< Returns the winning window or an empty list.
	std::size_t moveCount() const;          //!< Returns the number of accepted moves.
	std::optional<Coord> lastMove() const;  //!< Returns the last accepted move.
	GameState state() const;                //!< Returns a copy of the full state.
	const GameConfig& config() const;       //!< Returns the rule settings.

public:
	void subscribeSignals(IGameSignalListener* listener, std::uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	//! Evaluate the position after mark was placed at c and update the game state.
	//! \note Expects m_mutex to be held.
	void evaluateMove(Coord c, Mark mark);

	//! Hand queued deltas to the event hub until the queue is empty.
	//! \note Expects m_dispatching to be set by the caller and m_mutex not to be held.
	void dispatchPending();

private:
	const GameConfig m_config;

	mutable std::mutex m_mutex; //!< Guards the board and state over a full move.
	Board m_board;
	GameState m_state;
	std::optional<Coord> m_lastMove{};

	std::deque<GameDelta> m_pendingDeltas; //!< Accepted moves not yet delivered to listeners. Guarded by m_mutex.
	bool m_dispatching{false};             //!< A playMove call is delivering m_pendingDeltas. Guarded by m_mutex.

	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace ftf
