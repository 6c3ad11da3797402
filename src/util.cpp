// Utility helpers for hex and string handling
#include "relgate/util.hpp"

#include "relgate/consts.hpp"

#include <algorithm>
#include <cctype>

namespace relgate {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string short_hex(std::string_view hex) {
  return std::string(hex.substr(0, consts::kShortHexLen));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_words(std::string_view sv) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && (sv[i] == ' ' || sv[i] == '\t'))
      ++i;
    const std::size_t start = i;
    while (i < sv.size() && sv[i] != ' ' && sv[i] != '\t')
      ++i;
    if (i > start)
      out.emplace_back(sv.substr(start, i - start));
  }
  return out;
}

} // namespace strutil

} // namespace relgate
