#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace ftf {

using Id = std::int64_t; //!< Row or column index on the board.

//! Cell on the unbounded board.
//! \note Rows grow downwards and columns to the right. There is no origin convention beyond that.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

//! Hash functor to use Coord as key of unordered containers.
struct CoordHash {
	std::size_t operator()(const Coord& c) const noexcept {
		const auto rowHash = std::hash<Id>{}(c.row);
		const auto colHash = std::hash<Id>{}(c.col);
		return rowHash ^ (colHash + 0x9e3779b9u + (rowHash << 6u) + (rowHash >> 2u));
	}
};

} // namespace ftf
