#ifndef GEOHASH_CLI_HPP
#define GEOHASH_CLI_HPP

#include "command_registry.hpp"
#include <boost/program_options.hpp>
#include <istream>
#include <string>

struct CommandInvocation {
	std::string command;
	CommandRequest request;
};

// Bind encode, decode, bbox, distance and length to the core library
void registerGeohashCommands(CommandRegistry& registry);

// User-visible options; defaults come from LOG_LEVEL, GEOHASH_OUTPUT and GEOHASH_RADIUS_KM
boost::program_options::options_description geohashOptions();

// Parse argv against the visible options plus the positional command and args.
// Tokens such as "-33.8, 151.2" or "-.5" are kept as positional arguments.
boost::program_options::variables_map parseCommandLine(int argc,
													   const char* const argv[],
													   const boost::program_options::options_description& visible);

// Resolve the verb and its request. A first positional that is not a known verb
// is encoded; -d/--decode selects decode; a command other than length with no
// arguments takes the last non-empty line of in.
CommandInvocation buildRequest(const boost::program_options::variables_map& vm,
							   const CommandRegistry& registry,
							   std::istream& in);

// Last non-empty line of in, with surrounding whitespace removed
std::string readLastLine(std::istream& in);

#endif // GEOHASH_CLI_HPP
