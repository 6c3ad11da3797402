#include "relgate/config.hpp"

#include "relgate/fs.hpp"
#include "relgate/repo.hpp"
#include "relgate/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>

namespace relgate {

namespace gfs = relgate::fs;

GateConfig parse_config(std::string_view text) {
  GateConfig cfg{};
  std::istringstream iss{std::string(text)};

  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string s = strutil::trim(line);
    if (s.empty() || s[0] == '#')
      continue; // allow comments

    const auto colon = s.find(':');
    if (colon == std::string::npos) {
      throw std::runtime_error("config line " + std::to_string(lineno) + ": expected 'key: value'");
    }
    const std::string key = strutil::trim(std::string_view(s).substr(0, colon));
    const std::string value = strutil::trim(std::string_view(s).substr(colon + 1));

    if (key == "project") {
      cfg.project = value;
    } else if (key == "release_branch") {
      cfg.release_branch = value;
    } else if (key == "version_file") {
      cfg.version_file = value;
    } else if (key == "version_pattern") {
      cfg.version_pattern = value;
    } else if (key == "tag_prefix") {
      cfg.tag_prefix = value;
    } else if (key == "tag_helper") {
      cfg.tag_helper = strutil::split_words(value);
    } else {
      throw std::runtime_error("config line " + std::to_string(lineno) + ": unknown key '" + key +
                               "'");
    }
  }

  if (cfg.release_branch.empty()) {
    throw std::runtime_error("config: release_branch must not be empty");
  }
  if (cfg.version_file.empty()) {
    throw std::runtime_error("config: version_file must not be empty");
  }
  if (cfg.tag_helper.empty()) {
    throw std::runtime_error("config: tag_helper must not be empty");
  }
  return cfg;
}

GateConfig load_config(const Repository &repo) {
  const auto path = repo.config_file();
  if (!gfs::exists(path))
    return GateConfig{};
  try {
    return parse_config(gfs::read_text(path));
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(path.string() + ": " + e.what());
  }
}

std::string resolve_project_name(const Repository &repo, const GateConfig &cfg) {
  if (!cfg.project.empty())
    return cfg.project;
  auto name = repo.root().filename();
  if (name.empty())
    name = repo.root().parent_path().filename(); // root given with a trailing '/'
  return name.string();
}

} // namespace relgate
