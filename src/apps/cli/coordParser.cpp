#include "coordParser.hpp"

#include <charconv>

namespace ftf::cli {

static constexpr std::string_view kWhitespace = " \t\r\n";

static std::string_view trim(std::string_view s) {
	const auto first = s.find_first_not_of(kWhitespace);
	if (first == std::string_view::npos) {
		return {};
	}
	const auto last = s.find_last_not_of(kWhitespace);
	return s.substr(first, last - first + 1);
}

//! Signed integer filling the whole (trimmed) input.
static std::optional<Id> parseId(std::string_view s) {
	s = trim(s);
	if (!s.empty() && s.front() == '+') {
		s.remove_prefix(1);
		if (!s.empty() && s.front() == '-')
			return std::nullopt;
	}
	if (s.empty())
		return std::nullopt;

	Id value{};
	const auto end          = s.data() + s.size();
	const auto [ptr, error] = std::from_chars(s.data(), end, value);
	if (error != std::errc{} || ptr != end)
		return std::nullopt;

	return value;
}

std::optional<Coord> parseCoord(const std::string_view text) {
	const auto separator = text.find(',');
	if (separator == std::string_view::npos || text.find(',', separator + 1) != std::string_view::npos) {
		return std::nullopt;
	}

	const auto row = parseId(text.substr(0, separator));
	const auto col = parseId(text.substr(separator + 1));
	if (!row || !col) {
		return std::nullopt;
	}
	return Coord{*row, *col};
}

} // namespace ftf::cli
