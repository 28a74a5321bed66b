#pragma once

#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class OutputFormat { Text, Json };

struct CommandRequest {
	std::vector<std::string> args;
	double radiusKm		= 0.0;
	OutputFormat format = OutputFormat::Text;
};

class CommandRegistry {
public:
	using Handler = std::function<std::string(const CommandRequest&)>;

	// Register a verb; a later registration replaces an earlier one
	void add(const std::string& verb, const std::string& help, Handler handler) {
		commands_[verb] = Entry{help, std::move(handler)};
	}

	bool contains(const std::string& verb) const {
		return commands_.find(verb) != commands_.end();
	}

	// Run the handler bound to verb and return its formatted result
	std::string dispatch(const std::string& verb, const CommandRequest& request) const {
		auto it = commands_.find(verb);
		if (it == commands_.end()) {
			throw std::invalid_argument("Unknown command: " + verb);
		}
		return it->second.handler(request);
	}

	std::string usage() const {
		std::ostringstream ss;
		ss << "Commands:\n";
		for (const auto& [verb, entry] : commands_) {
			ss << "  " << verb << "\n        " << entry.help << "\n";
		}
		return ss.str();
	}

private:
	struct Entry {
		std::string help;
		Handler handler;
	};

	std::map<std::string, Entry> commands_;
};
