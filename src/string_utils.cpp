#include "string_utils.hpp"
#include "geohash_errors.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

std::string trim(const std::string& s) {
	size_t begin = s.find_first_not_of(WHITESPACE);
	if (begin == std::string::npos) {
		return "";
	}
	size_t end = s.find_last_not_of(WHITESPACE);
	return s.substr(begin, end - begin + 1);
}

double parseReal(const std::string& text, const std::string& what) {
	std::string value = trim(text);
	if (value.empty()) {
		throw ParseError("missing " + what + " value");
	}

	errno		 = 0;
	char* end	 = nullptr;
	double result = std::strtod(value.c_str(), &end);
	if (end != value.c_str() + value.size()) {
		throw ParseError("invalid " + what + " \"" + value + "\"");
	}
	// ERANGE also reports underflow, which leaves a usable value near zero
	if (errno == ERANGE && std::fabs(result) > 1.0) {
		throw ParseError(what + " \"" + value + "\" is out of double range");
	}
	if (!std::isfinite(result)) {
		throw ParseError("invalid " + what + " \"" + value + "\"");
	}
	return result;
}
