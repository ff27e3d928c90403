#pragma once

#include "data/coordinate.hpp"
#include "data/mark.hpp"

#include <optional>
#include <unordered_map>

namespace ftf {

//! Sparse board without boundaries. A cell that holds no mark is empty.
//! \note Cells can only be added. There is no way to clear a cell once it is taken.
class Board {
public:
	//! Inclusive bounding box of all placed marks.
	struct Bounds {
		Id minRow, maxRow;
		Id minCol, maxCol;
	};

public:
	bool place(Coord c, Mark mark); //!< Try to place a mark at the given coordinate. False if not free.

	std::optional<Mark> get(Coord c) const; //!< Mark at the given coordinate. Empty if the cell is free.
	bool isOccupied(Coord c) const;         //!< True if a mark was placed at the given coordinate.

	std::size_t size() const; //!< Number of occupied cells.
	bool empty() const;       //!< True if no mark was placed yet.

	//! Smallest rectangle containing every mark. Empty for an empty board.
	std::optional<Bounds> bounds() const;

private:
	std::unordered_map<Coord, Mark, CoordHash> m_cells{}; //!< Occupied cells.
	std::optional<Bounds> m_bounds{};                     //!< Extent of the occupied cells.
};

} // namespace ftf
