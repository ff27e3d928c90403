#include "coordParser.hpp"
#include "printers.hpp"

#include <gtest/gtest.h>
#include <limits>

namespace ftf::cli::gtest {

TEST(CoordParser, Valid) {
	EXPECT_EQ(parseCoord("3,4"), (Coord{3, 4}));
	EXPECT_EQ(parseCoord("0,0"), (Coord{0, 0}));
	EXPECT_EQ(parseCoord(" -2 , 7 "), (Coord{-2, 7}));
	EXPECT_EQ(parseCoord("+5,-6\r"), (Coord{5, -6}));
	EXPECT_EQ(parseCoord("\t12,\t-300"), (Coord{12, -300}));
}

TEST(CoordParser, Limits) {
	constexpr auto lowest  = std::numeric_limits<Id>::min();
	constexpr auto highest = std::numeric_limits<Id>::max();

	EXPECT_EQ(parseCoord("-9223372036854775808,9223372036854775807"), (Coord{lowest, highest}));
	EXPECT_FALSE(parseCoord("9223372036854775808,0").has_value());
	EXPECT_FALSE(parseCoord("0,-9223372036854775809").has_value());
}

TEST(CoordParser, Invalid) {
	EXPECT_FALSE(parseCoord("").has_value());
	EXPECT_FALSE(parseCoord("3").has_value());
	EXPECT_FALSE(parseCoord("3 4").has_value());
	EXPECT_FALSE(parseCoord(",4").has_value());
	EXPECT_FALSE(parseCoord("3,").has_value());
	EXPECT_FALSE(parseCoord("3,4,5").has_value());
	EXPECT_FALSE(parseCoord("a,4").has_value());
	EXPECT_FALSE(parseCoord("3,4x").has_value());
	EXPECT_FALSE(parseCoord("3.5,4").has_value());
	EXPECT_FALSE(parseCoord("+-3,4").has_value());
	EXPECT_FALSE(parseCoord("- 3,4").has_value());
	EXPECT_FALSE(parseCoord("quit").has_value());
}

} // namespace ftf::cli::gtest
