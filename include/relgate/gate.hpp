#pragma once
#include "relgate/config.hpp"
#include "relgate/repo.hpp"
#include "relgate/tags.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace relgate {

struct TagRequest {
  std::string project;
  std::string version;
  std::string tag;
  std::filesystem::path repo_root;
};

// Creates the tag for a request; returns the helper's exit status (0 = tagged).
using tag_helper_fn = std::function<int(const TagRequest &)>;

// Helper that runs `argv` as a process in the repository root, exporting
// RELGATE_PROJECT, RELGATE_VERSION and RELGATE_TAG.
tag_helper_fn make_process_tag_helper(std::vector<std::string> argv);

enum class Outcome : std::uint8_t {
  AlreadyTagged,
  Tagged,
  WrongBranch,
  DirtyTree,
  TaggingFailed,
  Error,
};

// 0 for AlreadyTagged/Tagged, 1 for everything else
int exit_code(Outcome outcome);

class ReleaseGate {
public:
  ReleaseGate(Repository repo, GateConfig cfg, tag_helper_fn helper, std::ostream &out,
              std::ostream &err);

  // HEAD is on the release branch; reports the expected branch otherwise.
  [[nodiscard]] bool check_branch() const;

  // No tracked file is modified; lists the offenders otherwise.
  [[nodiscard]] bool check_clean() const;

  // Throws std::runtime_error if the version cannot be resolved.
  [[nodiscard]] std::string current_version() const;

  [[nodiscard]] std::string tag_for(std::string_view version) const;
  [[nodiscard]] std::optional<TagInfo> version_tag(std::string_view version) const;
  [[nodiscard]] bool is_version_tagged(std::string_view version) const;

  // Invoke the tagging helper once; false if it failed.
  [[nodiscard]] bool tag_release(std::string_view version) const;

  // The whole gate. Never throws; operational errors become Outcome::Error.
  Outcome run() const;

  [[nodiscard]] const std::string &project() const { return project_; }

private:
  Outcome run_checks() const;

  Repository repo_;
  GateConfig cfg_;
  tag_helper_fn helper_;
  std::ostream &out_;
  std::ostream &err_;
  std::string project_;
};

} // namespace relgate
