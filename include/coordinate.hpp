#ifndef COORDINATE_HPP
#define COORDINATE_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

constexpr double MIN_LATITUDE  = -90.0;
constexpr double MAX_LATITUDE  = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

struct Coordinate {
	double latitude;
	double longitude;

	nlohmann::json toJson() const;
};

// Parse "lat, lng" into a validated coordinate.
// Throws FormatError, ParseError or RangeError.
Coordinate parseCoordinate(const std::string& coords);

// Throws RangeError if either axis lies outside its domain
void validateCoordinate(double latitude, double longitude);

// Rescale value in [min, max] to the full unsigned 32-bit space.
// The upper edge saturates at 0xFFFFFFFF.
uint32_t mapToFraction(double value, double min, double max);
double unmapFromFraction(uint32_t fraction, double min, double max);

#endif // COORDINATE_HPP
