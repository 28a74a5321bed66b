#include "geohash_cli.hpp"
#include "coordinate.hpp"
#include "geo_utils.hpp"
#include "geohash_codec.hpp"
#include "geohash_errors.hpp"
#include "string_utils.hpp"
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace po = boost::program_options;

namespace {

const std::string& requireArg(const CommandRequest& request, size_t index, const char* name) {
	if (request.args.size() <= index) {
		throw FormatError(std::string("missing ") + name + " argument");
	}
	return request.args[index];
}

// A leading '-' followed by a digit or ".digit" is a negative number, not an option
bool isNegativeNumber(const std::string& token) {
	if (token.size() < 2 || token[0] != '-') {
		return false;
	}
	if (std::isdigit(static_cast<unsigned char>(token[1]))) {
		return true;
	}
	return token[1] == '.' && token.size() > 2 && std::isdigit(static_cast<unsigned char>(token[2]));
}

std::vector<po::option> negativeNumberParser(std::vector<std::string>& args) {
	std::vector<po::option> result;
	if (!args.empty() && isNegativeNumber(args.front())) {
		// An empty string_key marks the option as positional
		po::option opt;
		opt.value.push_back(args.front());
		opt.original_tokens.push_back(args.front());
		result.push_back(opt);
		args.erase(args.begin());
	}
	return result;
}

std::string encodeCommand(const CommandRequest& request) {
	Coordinate c	 = parseCoordinate(requireArg(request, 0, "coordinate"));
	std::string hash = encodeGeohash(c.latitude, c.longitude);

	if (request.format == OutputFormat::Json) {
		nlohmann::json j;
		j["geohash"]	= hash;
		j["coordinate"] = c.toJson();
		return j.dump();
	}
	return hash;
}

std::string decodeCommand(const CommandRequest& request) {
	const std::string& hash = requireArg(request, 0, "geohash");
	Coordinate c			= decodeGeohash(hash);

	if (request.format == OutputFormat::Json) {
		nlohmann::json j;
		j["geohash"]	= hash;
		j["coordinate"] = c.toJson();
		return j.dump();
	}

	std::ostringstream ss;
	ss << std::fixed << std::setprecision(4) << c.latitude << ", " << c.longitude;
	return ss.str();
}

std::string bboxCommand(const CommandRequest& request) {
	Coordinate c	= parseCoordinate(requireArg(request, 0, "coordinate"));
	BoundingBox box = boundingBox(c.latitude, c.longitude, request.radiusKm);

	if (request.format == OutputFormat::Json) {
		nlohmann::json j;
		j["center"]		 = c.toJson();
		j["radiusKm"]	 = request.radiusKm;
		j["boundingBox"] = box.toJson();
		return j.dump();
	}

	std::ostringstream ss;
	ss << std::fixed << std::setprecision(6) << box.minLat << ", " << box.maxLat << ", " << box.minLng << ", "
	   << box.maxLng;
	return ss.str();
}

std::string distanceCommand(const CommandRequest& request) {
	Coordinate from = parseCoordinate(requireArg(request, 0, "first coordinate"));
	Coordinate to	= parseCoordinate(requireArg(request, 1, "second coordinate"));
	double km		= haversineDistance(from, to);

	if (request.format == OutputFormat::Json) {
		nlohmann::json j;
		j["from"]		= from.toJson();
		j["to"]			= to.toJson();
		j["distanceKm"] = km;
		return j.dump();
	}

	std::ostringstream ss;
	ss << std::fixed << std::setprecision(3) << km;
	return ss.str();
}

std::string lengthCommand(const CommandRequest& request) {
	double radius = request.args.empty() ? request.radiusKm : parseReal(request.args[0], "radius");
	int length	  = estimateLength(radius);

	if (request.format == OutputFormat::Json) {
		nlohmann::json j;
		j["radiusKm"] = radius;
		j["length"]	  = length;
		return j.dump();
	}
	return std::to_string(length);
}

} // namespace

void registerGeohashCommands(CommandRegistry& registry) {
	registry.add("encode", "encode \"<lat>, <lng>\" into a 12-character geohash", encodeCommand);
	registry.add("decode", "decode <geohash> into \"<lat>, <lng>\"", decodeCommand);
	registry.add("bbox",
				 "bbox \"<lat>, <lng>\" --radius <km>: print minLat, maxLat, minLng, maxLng",
				 bboxCommand);
	registry.add("distance", "distance \"<lat>, <lng>\" \"<lat>, <lng>\": great-circle distance in km", distanceCommand);
	registry.add("length", "length [<km>]: geohash length matching a search radius", lengthCommand);
	spdlog::debug("Registered geohash commands");
}

boost::program_options::options_description geohashOptions() {
	const char* log_level = getenv("LOG_LEVEL");
	const char* output	  = getenv("GEOHASH_OUTPUT");
	const char* radius	  = getenv("GEOHASH_RADIUS_KM");

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "produce help message")
		("log-level,l",
		 po::value<std::string>()->default_value(log_level ? log_level : "warn"),
		 "logging level (debug, info, warn, error)")
		("json,j",
		 po::bool_switch()->default_value(output ? std::string(output) == "json" : false),
		 "print results as JSON")
		("radius,r",
		 po::value<double>()->default_value(radius ? parseReal(radius, "GEOHASH_RADIUS_KM") : 0.0),
		 "search radius in kilometres (bbox, length)")
		("decode,d", po::value<std::string>()->implicit_value(""), "geohash to decode");
	return desc;
}

boost::program_options::variables_map parseCommandLine(int argc,
													   const char* const argv[],
													   const po::options_description& visible) {
	po::options_description hidden;
	hidden.add_options()
		("command", po::value<std::string>(), "command to run")
		("args", po::value<std::vector<std::string>>()->composing(), "command arguments");

	po::options_description all;
	all.add(visible).add(hidden);

	po::positional_options_description positional;
	positional.add("command", 1).add("args", -1);

	po::variables_map vm;
	po::store(po::command_line_parser(argc, argv)
				.options(all)
				.positional(positional)
				.extra_style_parser(negativeNumberParser)
				.run(),
			  vm);
	po::notify(vm);
	return vm;
}

CommandInvocation buildRequest(const po::variables_map& vm, const CommandRegistry& registry, std::istream& in) {
	CommandInvocation invocation;
	CommandRequest& request = invocation.request;
	request.radiusKm		= vm["radius"].as<double>();
	request.format			= vm["json"].as<bool>() ? OutputFormat::Json : OutputFormat::Text;

	if (vm.count("decode")) {
		// The hash is either the option's own value or the next positional token
		invocation.command = "decode";
		if (!vm["decode"].as<std::string>().empty()) {
			request.args.push_back(vm["decode"].as<std::string>());
		}
		if (vm.count("command")) {
			request.args.push_back(vm["command"].as<std::string>());
		}
	} else if (vm.count("command")) {
		invocation.command = vm["command"].as<std::string>();
		if (!registry.contains(invocation.command)) {
			// A bare coordinate is encoded
			request.args.push_back(invocation.command);
			invocation.command = "encode";
		}
	} else {
		invocation.command = "encode";
	}

	if (vm.count("args")) {
		const auto& args = vm["args"].as<std::vector<std::string>>();
		request.args.insert(request.args.end(), args.begin(), args.end());
	}

	if (request.args.empty() && invocation.command != "length") {
		spdlog::debug("No arguments for {}, reading standard input", invocation.command);
		std::string input = readLastLine(in);
		if (!input.empty()) {
			request.args.push_back(input);
		}
	}
	return invocation;
}

std::string readLastLine(std::istream& in) {
	std::string line;
	std::string last;
	while (std::getline(in, line)) {
		std::string trimmed = trim(line);
		if (!trimmed.empty()) {
			last = trimmed;
		}
	}
	return last;
}
