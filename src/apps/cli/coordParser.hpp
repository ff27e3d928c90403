#pragma once

#include "data/coordinate.hpp"

#include <optional>
#include <string_view>

namespace ftf::cli {

//! Parse a move typed as "row,col" (e.g. "3,4" or " -2 , 7 ").
//! \returns Empty if the text is malformed or a value does not fit into Id.
std::optional<Coord> parseCoord(std::string_view text);

} // namespace ftf::cli
