#include "geohash_codec.hpp"
#include "geohash_errors.hpp"
#include <spdlog/spdlog.h>

static_assert(sizeof(GEOHASH_ALPHABET) - 1 == (1u << BASE32_BITS), "alphabet must hold one symbol per 5-bit chunk");
static_assert(BASE32_BITS * GEOHASH_LENGTH <= 64, "geohash does not fit in the interleaved key");

namespace {

// Spread the 32 bits of v over the even bit positions of a 64-bit word
uint64_t spreadBits(uint32_t v) {
	uint64_t result = v;
	result			= (result | (result << 16)) & 0x0000FFFF0000FFFFULL;
	result			= (result | (result << 8)) & 0x00FF00FF00FF00FFULL;
	result			= (result | (result << 4)) & 0x0F0F0F0F0F0F0F0FULL;
	result			= (result | (result << 2)) & 0x3333333333333333ULL;
	result			= (result | (result << 1)) & 0x5555555555555555ULL;
	return result;
}

uint32_t compactBits(uint64_t v) {
	v = v & 0x5555555555555555ULL;
	v = (v | (v >> 1)) & 0x3333333333333333ULL;
	v = (v | (v >> 2)) & 0x0F0F0F0F0F0F0F0FULL;
	v = (v | (v >> 4)) & 0x00FF00FF00FF00FFULL;
	v = (v | (v >> 8)) & 0x0000FFFF0000FFFFULL;
	v = (v | (v >> 16)) & 0x00000000FFFFFFFFULL;
	return static_cast<uint32_t>(v);
}

// Index of c in the alphabet, or -1
int alphabetIndex(char c) {
	for (int i = 0; i < static_cast<int>(sizeof(GEOHASH_ALPHABET) - 1); i++) {
		if (GEOHASH_ALPHABET[i] == c) {
			return i;
		}
	}
	return -1;
}

} // namespace

uint64_t interleave(uint32_t lat32, uint32_t lng32) {
	return spreadBits(lat32) | (spreadBits(lng32) << 1);
}

std::pair<uint32_t, uint32_t> deinterleave(uint64_t key) {
	return {compactBits(key), compactBits(key >> 1)};
}

std::string toBase32(uint64_t key) {
	std::string result;
	result.reserve(GEOHASH_LENGTH);

	for (size_t i = 0; i < GEOHASH_LENGTH; i++) {
		result.push_back(GEOHASH_ALPHABET[key >> (64 - BASE32_BITS)]);
		key <<= BASE32_BITS;
	}
	return result;
}

uint64_t fromBase32(const std::string& hash) {
	uint64_t result = 0;
	for (size_t i = 0; i < hash.size(); i++) {
		int index = alphabetIndex(hash[i]);
		if (index < 0) {
			throw InvalidCharacterError(hash[i], i);
		}
		result = (result << BASE32_BITS) | static_cast<uint64_t>(index);
	}

	// Realign to a full 64-bit key; the dropped low bits decode as zero
	return result << GEOHASH_PAD_BITS;
}

void validateGeohash(const std::string& hash) {
	for (size_t i = 0; i < hash.size(); i++) {
		if (alphabetIndex(hash[i]) < 0) {
			throw InvalidCharacterError(hash[i], i);
		}
	}
}

std::string encodeGeohash(double latitude, double longitude) {
	validateCoordinate(latitude, longitude);

	uint32_t lat32 = mapToFraction(latitude, MIN_LATITUDE, MAX_LATITUDE);
	uint32_t lng32 = mapToFraction(longitude, MIN_LONGITUDE, MAX_LONGITUDE);
	uint64_t key   = interleave(lat32, lng32);

	spdlog::debug("Encoding ({}, {}) - lat32: {:#010x}, lng32: {:#010x}, key: {:#018x}",
				  latitude,
				  longitude,
				  lat32,
				  lng32,
				  key);

	return toBase32(key);
}

Coordinate decodeGeohash(const std::string& hash) {
	if (hash.size() != GEOHASH_LENGTH) {
		throw FormatError("geohash must be " + std::to_string(GEOHASH_LENGTH) + " characters, got " +
						  std::to_string(hash.size()));
	}
	validateGeohash(hash);
	return decodeUnchecked(hash);
}

Coordinate decodeUnchecked(const std::string& hash) {
	uint64_t key = fromBase32(hash);
	auto fractions = deinterleave(key);

	spdlog::debug("Decoding {} - key: {:#018x}, lat32: {:#010x}, lng32: {:#010x}",
				  hash,
				  key,
				  fractions.first,
				  fractions.second);

	Coordinate c;
	c.latitude	= unmapFromFraction(fractions.first, MIN_LATITUDE, MAX_LATITUDE);
	c.longitude = unmapFromFraction(fractions.second, MIN_LONGITUDE, MAX_LONGITUDE);
	return c;
}
