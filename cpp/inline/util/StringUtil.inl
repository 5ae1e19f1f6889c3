#include "util/StringUtil.hpp"

#include <cctype>
#include <charconv>
#include <string_view>

namespace util {

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      result.emplace_back(sv.substr(start, pos - start));
    }
    return result;
  }

  std::size_t start = 0, end;
  while ((end = s.find(sep, start)) != std::string::npos) {
    result.emplace_back(s, start, end - start);
    start = end + sep.size();
  }
  result.emplace_back(s, start);  // last segment
  return result;
}

inline std::string strip(const std::string& s) {
  std::size_t start = 0;
  std::size_t end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(start, end - start);
}

inline std::optional<int> parse_int(const std::string& s) {
  int value = 0;
  const char* first = s.data();
  const char* last = first + s.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || s.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace util
