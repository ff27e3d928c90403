#include "boardRenderer.hpp"

#include <cstdint>
#include <unordered_set>
#include <utility>

namespace ftf::cli {

//! Distance between lo and hi (lo <= hi). Does not overflow for any pair of Ids.
static std::uint64_t span(const Id lo, const Id hi) {
	return static_cast<std::uint64_t>(hi) - static_cast<std::uint64_t>(lo);
}

//! Id at offset from base. Caller guarantees the result is in range.
static Id offset(const Id base, const std::uint64_t n) {
	return static_cast<Id>(static_cast<std::uint64_t>(base) + n);
}

//! Clip [lo, hi] to kMaxViewExtent values around focus.
static std::pair<Id, Id> clipAxis(const Id lo, const Id hi, const Id focus) {
	constexpr auto last   = static_cast<std::uint64_t>(kMaxViewExtent - 1);
	constexpr auto radius = last / 2;

	if (span(lo, hi) <= last) {
		return {lo, hi};
	}

	Id from = span(lo, focus) > radius ? offset(lo, span(lo, focus) - radius) : lo;
	if (span(from, hi) < last) {
		from = offset(lo, span(lo, hi) - last);
	}
	return {from, offset(from, last)};
}

static void appendBorder(std::string& out, const char* left, const char* fill, const char* right, const std::uint64_t width) {
	out += left;
	for (std::uint64_t i = 0; i != width; ++i) {
		out += fill;
	}
	out += right;
}

std::string renderBoard(const Board& board, const Board::Bounds& view, const std::vector<Coord>& highlight) {
	const std::unordered_set<Coord, CoordHash> highlighted(highlight.begin(), highlight.end());

	const auto height = span(view.minRow, view.maxRow) + 1;
	const auto width  = span(view.minCol, view.maxCol) + 1;

	std::string out;
	appendBorder(out, "⌜", "⎺", "⌝\n", width);
	for (std::uint64_t r = 0; r != height; ++r) {
		out += '|';
		for (std::uint64_t c = 0; c != width; ++c) {
			const Coord cell{offset(view.minRow, r), offset(view.minCol, c)};
			const auto mark = board.get(cell);
			if (!mark) {
				out += ' ';
				continue;
			}

			const auto symbol = toSymbol(*mark);
			out += highlighted.contains(cell) ? static_cast<char>(symbol - 'a' + 'A') : symbol;
		}
		out += "|\n";
	}
	appendBorder(out, "⌞", "⎽", "⌟", width);
	return out;
}

std::string renderBoard(const Board& board, const std::vector<Coord>& highlight) {
	const auto bounds = board.bounds();
	if (!bounds) {
		return "⌜⌝\n⌞⌟";
	}
	return renderBoard(board, viewportAround(board, {bounds->minRow, bounds->minCol}), highlight);
}

Board::Bounds viewportAround(const Board& board, const Coord focus) {
	const auto bounds = board.bounds();
	if (!bounds) {
		return {focus.row, focus.row, focus.col, focus.col};
	}

	const auto [minRow, maxRow] = clipAxis(bounds->minRow, bounds->maxRow, focus.row);
	const auto [minCol, maxCol] = clipAxis(bounds->minCol, bounds->maxCol, focus.col);
	return {minRow, maxRow, minCol, maxCol};
}

} // namespace ftf::cli
