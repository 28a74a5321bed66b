#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>

// Characters removed by trim()
constexpr char WHITESPACE[] = " \t\r\n\f\v";

std::string trim(const std::string& s);

// Parse the whole of text as a finite real number. Values too small to
// represent become 0 or a subnormal. Throws ParseError naming what on
// malformed input, overflow, nan or inf.
double parseReal(const std::string& text, const std::string& what);

#endif // STRING_UTILS_HPP
