#include "geo_utils.hpp"
#include "geohash_codec.hpp"
#include "geohash_errors.hpp"
#include <algorithm>
#include <cmath>

namespace {

double toRadians(double degrees) {
	return degrees * M_PI / 180.0;
}

} // namespace

nlohmann::json BoundingBox::toJson() const {
	nlohmann::json j;
	j["minLat"] = minLat;
	j["maxLat"] = maxLat;
	j["minLng"] = minLng;
	j["maxLng"] = maxLng;
	return j;
}

BoundingBox boundingBox(double lat, double lng, double radiusKm) {
	if (!(radiusKm >= 0.0)) {
		throw RangeError("radius must not be negative");
	}
	if (!(std::fabs(lat) < MAX_LATITUDE)) {
		throw RangeError("bounding box is undefined at the poles");
	}

	double deltaLat = radiusKm / KM_PER_DEGREE_LAT;
	double deltaLng = radiusKm / (KM_PER_DEGREE_LNG * std::cos(toRadians(lat)));

	BoundingBox box;
	box.minLat = lat - deltaLat;
	box.maxLat = lat + deltaLat;
	box.minLng = lng - deltaLng;
	box.maxLng = lng + deltaLng;
	return box;
}

int estimateLength(double radiusKm) {
	if (!(radiusKm >= 0.0)) {
		throw RangeError("radius must not be negative");
	}
	if (radiusKm == 0.0) {
		return static_cast<int>(GEOHASH_LENGTH);
	}

	int steps = 0;
	for (double span = radiusKm; span < MERCATOR_MAX_KM; span *= 2.0) {
		steps++;
	}

	return std::clamp(steps / 5, 1, static_cast<int>(GEOHASH_LENGTH));
}

double haversineDistance(double lat1, double lng1, double lat2, double lng2) {
	double dLat = toRadians(lat2 - lat1);
	double dLng = toRadians(lng2 - lng1);

	double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
			   std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) * std::sin(dLng / 2) * std::sin(dLng / 2);
	double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

	return EARTH_RADIUS_KM * c;
}

double haversineDistance(const Coordinate& from, const Coordinate& to) {
	return haversineDistance(from.latitude, from.longitude, to.latitude, to.longitude);
}
