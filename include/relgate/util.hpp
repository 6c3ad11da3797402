#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace relgate {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// First 7 hex chars, for messages
auto short_hex(std::string_view hex) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip spaces, tabs and CR/LF from both ends
  auto trim(std::string_view sv) -> std::string;

  // Split on runs of spaces/tabs; empty fields are dropped
  auto split_words(std::string_view sv) -> std::vector<std::string>;
}

}
