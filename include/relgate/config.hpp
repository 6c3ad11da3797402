#pragma once
#include "relgate/consts.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace relgate {

class Repository; // fwd

struct GateConfig {
  std::string project;                                        // empty: use directory name
  std::string release_branch{consts::kDefaultBranch};
  std::filesystem::path version_file{std::string(consts::kDefaultVersionFile)};
  std::string version_pattern;                                // empty: whole first line
  std::string tag_prefix;                                     // empty: tag == version
  std::vector<std::string> tag_helper{std::string(consts::kDefaultTagHelper)};
};

// Parse "key: value" lines. Throws on unknown keys or malformed lines.
GateConfig parse_config(std::string_view text);

// Read .relgate from the repository root (defaults if missing)
GateConfig load_config(const Repository& repo);

// Configured project name, falling back to the working-tree directory name
std::string resolve_project_name(const Repository& repo, const GateConfig& cfg);

} // namespace relgate
