#include "commands.hpp"
#include "state_store.hpp"
#include "watch.hpp"

#include <getopt.h>
#include <unistd.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void usage(const char *name, std::ostream &out) {
	out << name << " [-f STATE_FILE] COMMAND [ARGS]\n"
	    << "  start [DEFINITION] [-u|--until HH:MM]   DEFINITION like 4p45b10\n"
	    << "  status\n"
	    << "  watch [PATH]                            default pomodoro.txt\n"
	    << "  pause\n"
	    << "  unpause\n"
	    << "  stop\n"
	    << "  info\n";
}

int run(int argc, char **argv) {
	const option long_options[] = {
	    {"file", required_argument, nullptr, 'f'},
	    {"help", no_argument, nullptr, 'h'},
	    {"until", required_argument, nullptr, 'u'},
	    {nullptr, 0, nullptr, 0},
	};

	int                        option;
	std::string                raw_file;
	std::optional<std::string> raw_until;
	while ((option = getopt_long(argc, argv, "f:hu:", long_options, nullptr)) != -1) {
		switch (option) {
		case 'f':
			raw_file = optarg;
			break;
		case 'h':
			usage(argv[0], std::cout);
			return 0;
		case 'u':
			raw_until = optarg;
			break;
		default:
			usage(argv[0], std::cerr);
			return 1;
		}
	}

	std::vector<std::string> args(argv + optind, argv + argc);
	if (args.empty()) {
		std::cerr << "pomocl: missing command\n";
		usage(argv[0], std::cerr);
		return 1;
	}
	const std::string command = args[0];
	args.erase(args.begin());

	const size_t max_args = (command == "start" || command == "watch") ? 1 : 0;
	if (args.size() > max_args) {
		throw std::invalid_argument("Too many arguments for " + command);
	}
	if (raw_until && command != "start") {
		throw std::invalid_argument("--until only applies to start");
	}

	const pomocl::state_store store(raw_file.empty() ? pomocl::default_state_path()
	                                                : std::filesystem::path(raw_file));
	const auto                now = std::chrono::system_clock::now();

	if (command == "start") {
		std::cout << pomocl::start_command(store, args.empty() ? "" : args[0], raw_until, now)
		          << '\n';
	} else if (command == "status") {
		std::cout << pomocl::status_command(store, now) << '\n';
	} else if (command == "watch") {
		pomocl::watcher watcher(store, args.empty() ? "pomodoro.txt" : args[0], std::cout);
		watcher.run();
	} else if (command == "stop") {
		std::cout << pomocl::stop_command(store) << '\n';
	} else if (command == "pause") {
		std::cout << pomocl::pause_command(store, now) << '\n';
	} else if (command == "unpause") {
		std::cout << pomocl::unpause_command(store, now) << '\n';
	} else if (command == "info") {
		std::cout << pomocl::info_command(store, now) << '\n';
	} else {
		std::cerr << "pomocl: unknown command " << command << '\n';
		usage(argv[0], std::cerr);
		return 1;
	}

	return 0;
}

} // namespace

int main(int argc, char **argv) {
	try {
		return run(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << "pomocl: " << e.what() << '\n';
		return 1;
	}
}
