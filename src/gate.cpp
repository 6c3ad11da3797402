#include "relgate/gate.hpp"

#include "relgate/consts.hpp"
#include "relgate/process.hpp"
#include "relgate/refs.hpp"
#include "relgate/status.hpp"
#include "relgate/util.hpp"
#include "relgate/version.hpp"

#include <stdexcept>
#include <utility>

namespace relgate {

tag_helper_fn make_process_tag_helper(std::vector<std::string> argv) {
  return [argv = std::move(argv)](const TagRequest &req) {
    const EnvVars env{
        {std::string(consts::kEnvProject), req.project},
        {std::string(consts::kEnvVersion), req.version},
        {std::string(consts::kEnvTag), req.tag},
    };
    return run_process(argv, req.repo_root, env);
  };
}

int exit_code(Outcome outcome) {
  switch (outcome) {
  case Outcome::AlreadyTagged:
  case Outcome::Tagged:
    return 0;
  case Outcome::WrongBranch:
  case Outcome::DirtyTree:
  case Outcome::TaggingFailed:
  case Outcome::Error:
    return 1;
  }
  return 1;
}

ReleaseGate::ReleaseGate(Repository repo, GateConfig cfg, tag_helper_fn helper, std::ostream &out,
                         std::ostream &err)
    : repo_(std::move(repo)), cfg_(std::move(cfg)), helper_(std::move(helper)), out_(out),
      err_(err), project_(resolve_project_name(repo_, cfg_)) {}

bool ReleaseGate::check_branch() const {
  const auto branch = repo_.current_branch();
  if (branch && *branch == cfg_.release_branch) {
    return true;
  }
  err_ << "Checkout branch '" << cfg_.release_branch << "' before generating release.\n";
  return false;
}

bool ReleaseGate::check_clean() const {
  const auto modified = modified_files(repo_);
  if (modified.empty()) {
    return true;
  }
  out_ << "Tree contains uncommitted modifications:\n";
  for (const auto &path : modified) {
    out_ << path << '\n';
  }
  return false;
}

std::string ReleaseGate::current_version() const {
  return read_version(repo_.root(), cfg_.version_file, cfg_.version_pattern);
}

std::string ReleaseGate::tag_for(std::string_view version) const {
  std::string tag = tag_name_for(version, cfg_.tag_prefix);
  if (!is_valid_tag_name(tag)) {
    throw std::runtime_error("version '" + std::string(version) +
                             "' does not give a valid tag name: '" + tag + "'");
  }
  return tag;
}

std::optional<TagInfo> ReleaseGate::version_tag(std::string_view version) const {
  return find_tag(repo_, tag_for(version));
}

bool ReleaseGate::is_version_tagged(std::string_view version) const {
  return version_tag(version).has_value();
}

bool ReleaseGate::tag_release(std::string_view version) const {
  const std::string tag = tag_for(version);

  // At-most-once: the tag may have appeared since the first lookup.
  if (find_tag(repo_, tag)) {
    out_ << tag << " already exists; not tagging again.\n";
    return true;
  }

  int status = 0;
  try {
    status = helper_(TagRequest{.project = project_,
                                .version = std::string(version),
                                .tag = tag,
                                .repo_root = repo_.root()});
  } catch (const std::exception &e) {
    err_ << "relgate: " << e.what() << '\n';
    status = 1;
  }
  if (status != 0) {
    err_ << "Failed to tag a release.\n";
    return false;
  }

  if (find_tag(repo_, tag)) {
    out_ << "Tagged " << project_ << ' ' << version << " as " << tag << ".\n";
  } else {
    err_ << "relgate: warning: tag helper succeeded but " << tags_ref(tag)
         << " was not found\n";
  }
  return true;
}

Outcome ReleaseGate::run() const {
  try {
    return run_checks();
  } catch (const std::exception &e) {
    err_ << "relgate: " << e.what() << '\n';
    return Outcome::Error;
  }
}

Outcome ReleaseGate::run_checks() const {
  if (!check_branch()) {
    return Outcome::WrongBranch;
  }
  if (!check_clean()) {
    return Outcome::DirtyTree;
  }

  const std::string version = current_version();
  if (const auto tag = version_tag(version)) {
    out_ << project_ << ' ' << version << " is already tagged as " << tag->name << ".\n";
    const auto head = repo_.head_commit();
    if (tag->commit && head && *tag->commit != *head) {
      out_ << "note: " << tag->name << " points at " << short_hex(*tag->commit)
           << ", HEAD is at " << short_hex(*head) << ".\n";
    }
    return Outcome::AlreadyTagged;
  }

  out_ << "Current version " << version << " isn't tagged.\n";
  out_ << "Attempting to tag...\n";
  return tag_release(version) ? Outcome::Tagged : Outcome::TaggingFailed;
}

} // namespace relgate
