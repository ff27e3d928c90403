#include "core/game.hpp"
#include "core/winChecker.hpp"

#include "Logging.hpp"

#include <format>
#include <utility>

namespace ftf {

GameEngine::GameEngine(const GameConfig config) : m_config{config} {
}

MoveResult GameEngine::playMove(const Coord c) {
	auto logger = Logger();

	MoveResult result{};
	{
		std::lock_guard<std::mutex> lock(m_mutex);

		if (m_state.status != GameStatus::InProgress) {
			logger.Log(Logging::LogLevel::Warning, std::format("[GameEngine] Rejecting move ({}, {}): game is already over.", c.row, c.col));
			return {MoveError::GameAlreadyOver, m_state};
		}

		const auto mark = m_state.currentMark;
		if (!m_board.place(c, mark)) {
			logger.Log(Logging::LogLevel::Warning, std::format("[GameEngine] Rejecting move ({}, {}): cell is occupied.", c.row, c.col));
			return {MoveError::CellOccupied, m_state};
		}

		evaluateMove(c, mark);

		m_pendingDeltas.push_back(GameDelta{
		        .moveId      = m_state.moveCount,
		        .mark        = mark,
		        .coord       = c,
		        .nextMark    = m_state.currentMark,
		        .status      = m_state.status,
		        .winningLine = m_state.winningLine,
		});
		result = {std::nullopt, m_state};

		// Another call is already delivering and picks up this delta after its own.
		if (m_dispatching) {
			return result;
		}
		m_dispatching = true;
	}

	dispatchPending();
	return result;
}

void GameEngine::evaluateMove(const Coord c, const Mark mark) {
	auto logger = Logger();

	++m_state.moveCount;
	m_lastMove = c;

	if (auto line = findWinningLine(m_board, c, mark)) {
		m_state.status      = GameStatus::Won;
		m_state.winner      = mark;
		m_state.winningLine = std::move(*line);
		logger.Log(Logging::LogLevel::Info, std::format("[GameEngine] {} won with move {} at ({}, {}).", toString(mark), m_state.moveCount, c.row, c.col));
		return;
	}

	if (m_config.maxMoves != 0 && m_state.moveCount >= m_config.maxMoves) {
		m_state.status = GameStatus::Draw;
		logger.Log(Logging::LogLevel::Info, std::format("[GameEngine] Draw after {} moves.", m_state.moveCount));
		return;
	}

	m_state.currentMark = other(mark);
	logger.Log(Logging::LogLevel::Debug, std::format("[GameEngine] Move {}: {} at ({}, {}).", m_state.moveCount, toString(mark), c.row, c.col));
}

void GameEngine::dispatchPending() {
	while (true) {
		GameDelta delta{};
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			if (m_pendingDeltas.empty()) {
				m_dispatching = false;
				return;
			}
			delta = std::move(m_pendingDeltas.front());
			m_pendingDeltas.pop_front();
		}

		try {
			m_eventHub.publish(delta);
		} catch (...) {
			// Remaining deltas are delivered by the next accepted move.
			std::lock_guard<std::mutex> lock(m_mutex);
			m_dispatching = false;
			throw;
		}
	}
}

const Board& GameEngine::board() const {
	return m_board;
}

Mark GameEngine::currentMark() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state.currentMark;
}

GameStatus GameEngine::status() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state.status;
}

bool GameEngine::isOver() const {
	return status() != GameStatus::InProgress;
}

std::optional<Mark> GameEngine::winner() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state.winner;
}

std::vector<Coord> GameEngine::winningLine() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state.winningLine;
}

std::size_t GameEngine::moveCount() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state.moveCount;
}

std::optional<Coord> GameEngine::lastMove() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_lastMove;
}

GameState GameEngine::state() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state;
}

const GameConfig& GameEngine::config() const {
	return m_config;
}

void GameEngine::subscribeSignals(IGameSignalListener* listener, const std::uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void GameEngine::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void GameEngine::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void GameEngine::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace ftf
