#include "geohash_errors.hpp"
#include <cstdio>

namespace {

std::string describeCharacter(char character, std::size_t index) {
	unsigned char byte = static_cast<unsigned char>(character);
	if (byte >= 0x20 && byte < 0x7f) {
		return "invalid character '" + std::string(1, character) + "' at index " + std::to_string(index);
	}

	// Control bytes and pieces of multi-byte UTF-8 sequences
	char hex[8];
	std::snprintf(hex, sizeof(hex), "0x%02x", byte);
	return "invalid byte " + std::string(hex) + " at byte offset " + std::to_string(index);
}

} // namespace

InvalidCharacterError::InvalidCharacterError(char character, std::size_t index) :
  GeohashError(describeCharacter(character, index)),
  character_(character),
  index_(index) {}
