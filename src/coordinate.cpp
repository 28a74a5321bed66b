#include "coordinate.hpp"
#include "geohash_errors.hpp"
#include "string_utils.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace {

constexpr double TWO_POW_32 = 4294967296.0;

} // namespace

nlohmann::json Coordinate::toJson() const {
	nlohmann::json j;
	j["latitude"]  = latitude;
	j["longitude"] = longitude;
	return j;
}

Coordinate parseCoordinate(const std::string& coords) {
	size_t comma = coords.find(',');
	if (comma == std::string::npos || coords.find(',', comma + 1) != std::string::npos) {
		throw FormatError("Invalid coordinates format. Use \"lat, lng\".");
	}

	Coordinate c;
	c.latitude	= parseReal(coords.substr(0, comma), "latitude");
	c.longitude = parseReal(coords.substr(comma + 1), "longitude");
	validateCoordinate(c.latitude, c.longitude);
	return c;
}

void validateCoordinate(double latitude, double longitude) {
	// Negated comparisons so that NaN is rejected as well
	if (!(latitude >= MIN_LATITUDE && latitude <= MAX_LATITUDE)) {
		std::ostringstream ss;
		ss << "latitude must be in the range [-90, 90], got " << latitude;
		throw RangeError(ss.str());
	}
	if (!(longitude >= MIN_LONGITUDE && longitude <= MAX_LONGITUDE)) {
		std::ostringstream ss;
		ss << "longitude must be in the range [-180, 180], got " << longitude;
		throw RangeError(ss.str());
	}
}

uint32_t mapToFraction(double value, double min, double max) {
	double scaled = std::floor(TWO_POW_32 * ((value - min) / (max - min)));
	if (scaled >= TWO_POW_32) {
		return std::numeric_limits<uint32_t>::max();
	}
	if (scaled <= 0.0) {
		return 0;
	}
	return static_cast<uint32_t>(scaled);
}

double unmapFromFraction(uint32_t fraction, double min, double max) {
	return min + (static_cast<double>(static_cast<uint64_t>(fraction)) / TWO_POW_32) * (max - min);
}
