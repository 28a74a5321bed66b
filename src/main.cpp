#include "command_registry.hpp"
#include "geohash_cli.hpp"
#include <iostream>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
	try {
		CommandRegistry registry;
		registerGeohashCommands(registry);

		auto desc = geohashOptions();
		auto vm	  = parseCommandLine(argc, argv, desc);

		if (vm.count("help")) {
			std::cout << "Usage: geohash [options] <command> [args...]\n\n" << desc << "\n" << registry.usage();
			return 0;
		}

		// Set log level
		std::string log_level = vm["log-level"].as<std::string>();
		if (log_level == "debug") {
			spdlog::set_level(spdlog::level::debug);
		} else if (log_level == "info") {
			spdlog::set_level(spdlog::level::info);
		} else if (log_level == "warn") {
			spdlog::set_level(spdlog::level::warn);
		} else if (log_level == "error") {
			spdlog::set_level(spdlog::level::err);
		} else {
			throw std::runtime_error("Invalid log level: " + log_level);
		}

		CommandInvocation invocation = buildRequest(vm, registry, std::cin);

		spdlog::debug("Dispatching {} with {} argument(s)", invocation.command, invocation.request.args.size());
		std::cout << registry.dispatch(invocation.command, invocation.request) << std::endl;
		return 0;
	} catch (const std::exception& e) {
		spdlog::error("Error: {}", e.what());
		return 1;
	}
}
