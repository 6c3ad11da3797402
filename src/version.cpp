#include "relgate/version.hpp"

#include "relgate/fs.hpp"
#include "relgate/util.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace gfs = relgate::fs;

namespace relgate {

static std::string first_version_line(const std::string &text) {
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    std::string s = strutil::trim(line);
    if (s.empty() || s[0] == '#') {
      continue;
    }
    return s;
  }
  return {};
}

static std::string match_version(const std::string &text, std::string_view pattern) {
  std::regex re;
  try {
    re = std::regex(std::string(pattern), std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    throw std::runtime_error("version_pattern is not a valid regex: " + std::string(e.what()));
  }
  std::smatch m;
  if (!std::regex_search(text, m, re)) {
    return {};
  }
  return strutil::trim(m.size() > 1 ? m.str(1) : m.str(0));
}

std::string read_version(const std::filesystem::path &root,
                         const std::filesystem::path &version_file, std::string_view pattern) {
  const auto path = version_file.is_absolute() ? version_file : root / version_file;
  if (!gfs::exists(path)) {
    throw std::runtime_error("version file not found: " + path.string());
  }
  const std::string text = gfs::read_text(path);

  std::string version = pattern.empty() ? first_version_line(text) : match_version(text, pattern);
  if (version.empty()) {
    throw std::runtime_error("could not determine current version from " + path.string());
  }
  if (std::ranges::any_of(version, [](char c) { return c == ' ' || c == '\t'; })) {
    throw std::runtime_error("version '" + version + "' contains whitespace");
  }
  return version;
}

} // namespace relgate
