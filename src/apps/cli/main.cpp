#include "Logging.hpp"
#include "terminalGame.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <string_view>

static void printUsage(std::ostream& os) {
	os << "Usage: firstToFive [--demo] [--max-moves N]\n"
	      "  --demo          Play a scripted example game.\n"
	      "  --max-moves N   Declare a draw after N moves without a winner (0: no limit).\n"
	      "  --help          Show this text.\n"
	      "Enter moves as row,col (e.g. 3,4). Type quit to leave.\n";
}

static bool parseCount(std::string_view text, std::size_t& value) {
	const auto end          = text.data() + text.size();
	const auto [ptr, error] = std::from_chars(text.data(), end, value);
	return error == std::errc{} && ptr == end && !text.empty();
}

int main(int argc, char** argv) {
	ftf::GameConfig config{};
	bool demo = false;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		if (arg == "--help" || arg == "-h") {
			printUsage(std::cout);
			return 0;
		} else if (arg == "--demo") {
			demo = true;
		} else if (arg == "--max-moves" && i + 1 < argc && parseCount(argv[i + 1], config.maxMoves)) {
			++i;
		} else {
			ftf::cli::Logger().Log(Logging::LogLevel::Error, std::format("[Main] Invalid argument '{}'.", arg));
			std::cerr << std::format("Invalid argument '{}'.\n", arg);
			printUsage(std::cerr);
			return 1;
		}
	}

	ftf::cli::TerminalGame game(std::cin, std::cout, config);
	bool finished = true;
	if (demo) {
		game.runDemo();
	} else {
		finished = game.run();
	}

	std::cout << (finished ? "\nGame has ended!\n" : "\nGame aborted.\n");
	return 0;
}
