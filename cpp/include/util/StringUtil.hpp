#pragma once

/*
 * Various string utilities
 */
#include <optional>
#include <string>
#include <vector>

namespace util {

inline std::string make_whitespace(size_t n) { return std::string(n, ' '); }

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

/*
 * strip(s) behaves just like s.strip() in python.
 */
std::string strip(const std::string& s);

/*
 * Parses the entire string as a base-10 int. Returns std::nullopt if any character is left over,
 * including leading/trailing whitespace, or if the value does not fit in an int.
 */
std::optional<int> parse_int(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
