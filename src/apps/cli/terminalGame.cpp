#include "terminalGame.hpp"

#include "Logging.hpp"
#include "boardRenderer.hpp"
#include "coordParser.hpp"
#include "core/winChecker.hpp"

#include <array>
#include <format>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace ftf::cli {

//! Demo: PlayerOne fills row 0 out of order while PlayerTwo builds a diagonal one move too slow.
static constexpr std::array<Coord, 9> kDemoMoves{{
        {0, 0},
        {1, 2},
        {0, 1},
        {2, 3},
        {0, 4},
        {5, 6},
        {0, 3},
        {3, 4},
        {0, 2},
}};

static std::string formatLine(const std::vector<Coord>& line) {
	std::string text;
	for (const auto& c: line) {
		if (!text.empty()) {
			text += ' ';
		}
		text += std::format("({}, {})", c.row, c.col);
	}
	return text;
}

TerminalGame::TerminalGame(std::istream& in, std::ostream& out, const GameConfig config) : m_in{in}, m_out{out}, m_engine{config} {
	m_engine.subscribeState(this);
}

TerminalGame::~TerminalGame() {
	m_engine.unsubscribeState(this);
}

const GameEngine& TerminalGame::engine() const {
	return m_engine;
}

bool TerminalGame::run() {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[TerminalGame] Session started.");

	m_out << renderBoard(m_engine.board()) << '\n';
	while (!m_engine.isOver()) {
		Coord coord{};
		if (!readMove(coord)) {
			logger.Log(Logging::LogLevel::Info, std::format("[TerminalGame] Session stopped after {} moves.", m_engine.moveCount()));
			return false;
		}

		const auto result = m_engine.playMove(coord);
		if (!result.accepted()) {
			switch (*result.error) {
			case MoveError::CellOccupied:
				m_out << std::format("Cell ({}, {}) is already taken.\n", coord.row, coord.col);
				break;
			case MoveError::GameAlreadyOver:
				m_out << "The game is already over.\n";
				break;
			}
		}
	}

	logger.Log(Logging::LogLevel::Info, "[TerminalGame] Session finished.");
	return true;
}

void TerminalGame::runDemo() {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[TerminalGame] Demo started.");

	for (const auto& coord: kDemoMoves) {
		const auto result = m_engine.playMove(coord);
		if (!result.accepted()) {
			logger.Log(Logging::LogLevel::Error, std::format("[TerminalGame] Demo move ({}, {}) was rejected.", coord.row, coord.col));
			break;
		}

		if (m_engine.isOver()) {
			return;
		}
	}

	printOutcome();
}

void TerminalGame::onGameDelta(const GameDelta& delta) {
	printBoard(delta);
	if (delta.status != GameStatus::InProgress) {
		printOutcome();
	}
}

bool TerminalGame::readMove(Coord& coord) {
	std::string line;
	while (true) {
		const auto mark = m_engine.currentMark();
		m_out << std::format("{} ({}) move [row,col]: ", toString(mark), toSymbol(mark));
		if (!std::getline(m_in, line)) {
			return false;
		}
		if (line == "quit" || line == "exit") {
			return false;
		}

		if (const auto parsed = parseCoord(line)) {
			coord = *parsed;
			return true;
		}
		m_out << "Invalid move. Enter row and column like: 3,4\n";
	}
}

void TerminalGame::printBoard(const GameDelta& delta) {
	const auto view = viewportAround(m_engine.board(), delta.coord);
	m_out << renderBoard(m_engine.board(), view, delta.winningLine) << '\n';
}

void TerminalGame::printOutcome() {
	const auto state = m_engine.state();
	switch (state.status) {
	case GameStatus::Won: {
		m_out << std::format("{} has won!\n", toString(*state.winner));
		m_out << std::format("Winning line: {}\n", formatLine(state.winningLine));

		if (const auto lastMove = m_engine.lastMove()) {
			m_out << std::format("Longest line: {}\n", formatLine(longestLine(m_engine.board(), *lastMove)));
		}
		break;
	}
	case GameStatus::Draw:
		m_out << std::format("Draw after {} moves.\n", state.moveCount);
		break;
	case GameStatus::InProgress:
		m_out << std::format("Game stopped after {} moves.\n", state.moveCount);
		break;
	}
}

} // namespace ftf::cli
