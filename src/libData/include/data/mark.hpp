#pragma once

namespace ftf {

//! Ownership tag of a placed cell. An empty cell has no mark.
enum class Mark { PlayerOne = 1, PlayerTwo = 2 };

//! Returns the opposing mark.
inline constexpr Mark other(Mark mark) {
	return mark == Mark::PlayerOne ? Mark::PlayerTwo : Mark::PlayerOne;
}

//! Display name of a mark.
inline constexpr const char* toString(Mark mark) {
	return mark == Mark::PlayerOne ? "PlayerOne" : "PlayerTwo";
}

} // namespace ftf
