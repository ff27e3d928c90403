#include "core/winChecker.hpp"

#include <cassert>
#include <utility>

namespace ftf {

//! Move n cells from c along d.
//! \note Only used for cells that were already visited by a scan, so the result is in range.
static Coord advance(const Coord c, const Direction d, const std::size_t n) {
	const auto steps = static_cast<Id>(n);
	return {c.row + steps * d.dRow, c.col + steps * d.dCol};
}

//! Collect count cells starting at first along d.
static std::vector<Coord> collect(const Coord first, const Direction d, const std::size_t count) {
	std::vector<Coord> line;
	line.reserve(count);
	for (std::size_t i = 0; i != count; ++i) {
		line.push_back(advance(first, d, i));
	}
	return line;
}

std::optional<Coord> step(const Coord c, const Direction d) {
	constexpr auto lowest  = std::numeric_limits<Id>::min();
	constexpr auto highest = std::numeric_limits<Id>::max();

	if ((d.dRow > 0 && c.row == highest) || (d.dRow < 0 && c.row == lowest))
		return std::nullopt;
	if ((d.dCol > 0 && c.col == highest) || (d.dCol < 0 && c.col == lowest))
		return std::nullopt;

	return Coord{c.row + d.dRow, c.col + d.dCol};
}

std::size_t countDirection(const Board& board, const Coord origin, const Mark mark, const Direction d, const std::size_t limit) {
	std::size_t count = 0;

	auto next = step(origin, d);
	while (count < limit && next && board.get(*next) == mark) {
		++count;
		next = step(*next, d);
	}
	return count;
}

std::optional<std::vector<Coord>> findWinningLine(const Board& board, const Coord origin, const Mark mark) {
	constexpr std::size_t scanLimit = kWinLength - 1;

	for (const auto d: kDirections) {
		const auto forward  = countDirection(board, origin, mark, d, scanLimit);
		const auto backward = countDirection(board, origin, mark, reversed(d), scanLimit);
		if (1u + forward + backward < kWinLength)
			continue;

		const auto first = advance(origin, reversed(d), backward);
		return collect(first, d, kWinLength);
	}

	return std::nullopt;
}

std::vector<Coord> lineThrough(const Board& board, const Coord origin, const Direction d) {
	const auto mark = board.get(origin);
	if (!mark)
		return {};

	const auto forward  = countDirection(board, origin, *mark, d);
	const auto backward = countDirection(board, origin, *mark, reversed(d));

	const auto line = collect(advance(origin, reversed(d), backward), d, 1u + forward + backward);
	assert(line.size() > backward && line[backward] == origin);
	return line;
}

std::vector<Coord> longestLine(const Board& board, const Coord origin) {
	std::vector<Coord> longest;
	for (const auto d: kDirections) {
		auto line = lineThrough(board, origin, d);
		if (line.size() > longest.size()) {
			longest = std::move(line);
		}
	}
	return longest;
}

} // namespace ftf
