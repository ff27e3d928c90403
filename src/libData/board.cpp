#include "data/board.hpp"

#include <algorithm>

namespace ftf {

bool Board::place(const Coord c, const Mark mark) {
	if (!m_cells.try_emplace(c, mark).second) {
		return false;
	}

	if (!m_bounds) {
		m_bounds = Bounds{c.row, c.row, c.col, c.col};
	} else {
		m_bounds->minRow = std::min(m_bounds->minRow, c.row);
		m_bounds->maxRow = std::max(m_bounds->maxRow, c.row);
		m_bounds->minCol = std::min(m_bounds->minCol, c.col);
		m_bounds->maxCol = std::max(m_bounds->maxCol, c.col);
	}
	return true;
}

std::optional<Mark> Board::get(const Coord c) const {
	const auto it = m_cells.find(c);
	if (it == m_cells.end()) {
		return std::nullopt;
	}
	return it->second;
}

bool Board::isOccupied(const Coord c) const {
	return m_cells.contains(c);
}

std::size_t Board::size() const {
	return m_cells.size();
}

bool Board::empty() const {
	return m_cells.empty();
}

std::optional<Board::Bounds> Board::bounds() const {
	return m_bounds;
}

} // namespace ftf
