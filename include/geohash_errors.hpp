#ifndef GEOHASH_ERRORS_HPP
#define GEOHASH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

// Base class for every failure raised by the geohash library
class GeohashError : public std::runtime_error {
public:
	explicit GeohashError(const std::string& what) :
	  std::runtime_error(what) {}
};

// Input does not have the "lat, lng" shape, or a geohash has the wrong length
class FormatError : public GeohashError {
public:
	using GeohashError::GeohashError;
};

// A latitude or longitude token is not a real number
class ParseError : public GeohashError {
public:
	using GeohashError::GeohashError;
};

// A value lies outside its geographic domain
class RangeError : public GeohashError {
public:
	using GeohashError::GeohashError;
};

// A geohash holds a byte outside the alphabet. index() is a byte offset,
// so a multi-byte UTF-8 symbol is reported by its first byte.
class InvalidCharacterError : public GeohashError {
public:
	InvalidCharacterError(char character, std::size_t index);

	char character() const {
		return character_;
	}
	std::size_t index() const {
		return index_;
	}

private:
	char character_;
	std::size_t index_;
};

#endif // GEOHASH_ERRORS_HPP
