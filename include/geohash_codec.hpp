#ifndef GEOHASH_CODEC_HPP
#define GEOHASH_CODEC_HPP

#include "coordinate.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

constexpr char GEOHASH_ALPHABET[] = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr std::size_t GEOHASH_LENGTH = 12;
constexpr unsigned BASE32_BITS		 = 5;

// Bits of the interleaved key that the string form does not carry
constexpr unsigned GEOHASH_PAD_BITS = 64 - BASE32_BITS * GEOHASH_LENGTH;

// Latitude bit i lands on key bit 2i, longitude bit i on key bit 2i+1
uint64_t interleave(uint32_t lat32, uint32_t lng32);
// Returns {lat32, lng32}
std::pair<uint32_t, uint32_t> deinterleave(uint64_t key);

// Emit the top 60 bits of key as 12 symbols, most significant chunk first
std::string toBase32(uint64_t key);
// Inverse of toBase32. Throws InvalidCharacterError.
uint64_t fromBase32(const std::string& hash);

// Throws InvalidCharacterError on the first symbol outside the alphabet
void validateGeohash(const std::string& hash);

// Throws RangeError for coordinates outside the geographic domain
std::string encodeGeohash(double latitude, double longitude);

// Throws FormatError on a wrong length, InvalidCharacterError on a bad symbol
Coordinate decodeGeohash(const std::string& hash);
// Same as decodeGeohash without the up-front validation pass
Coordinate decodeUnchecked(const std::string& hash);

#endif // GEOHASH_CODEC_HPP
