#ifndef GEO_UTILS_HPP
#define GEO_UTILS_HPP

#include "coordinate.hpp"
#include <nlohmann/json.hpp>

constexpr double EARTH_RADIUS_KM = 6371.0;
// Mean length of one degree of latitude
constexpr double KM_PER_DEGREE_LAT = 111.1;
// Length of one degree of longitude at the equator
constexpr double KM_PER_DEGREE_LNG = 111.320;
// Half the circumference covered by the Mercator projection
constexpr double MERCATOR_MAX_KM = 20037.726;

struct BoundingBox {
	double minLat;
	double maxLat;
	double minLng;
	double maxLng;

	nlohmann::json toJson() const;
};

// Box of half-size radiusKm around (lat, lng).
// Throws RangeError at the poles, where the longitude span diverges.
BoundingBox boundingBox(double lat, double lng, double radiusKm);

// Geohash length whose cell roughly matches radiusKm, in [1, 12].
// A radius of 0 asks for the finest precision.
int estimateLength(double radiusKm);

// Great-circle distance in kilometres
double haversineDistance(double lat1, double lng1, double lat2, double lng2);
double haversineDistance(const Coordinate& from, const Coordinate& to);

#endif // GEO_UTILS_HPP
