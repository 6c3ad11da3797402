#pragma once
// Shared helpers for building throwaway repositories in tests.
#include "relgate/consts.hpp"
#include "relgate/process.hpp"
#include "relgate/refs.hpp"
#include "relgate/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fixture {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on scope exit
class TempDir {
public:
  explicit TempDir(std::string_view name)
      : path_(fs::temp_directory_path() /
              (std::string(name) + "_" + std::to_string(std::random_device{}()))) {
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary | std::ios::trunc) << s;
}

inline std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Hermetic environment for fixture git commands: no user or system config.
inline const relgate::EnvVars &git_env() {
  static const relgate::EnvVars env{
      {"GIT_CONFIG_NOSYSTEM", "1"},
      {"GIT_CONFIG_GLOBAL", "/dev/null"},
      {"GIT_AUTHOR_NAME", "Release Bot"},
      {"GIT_AUTHOR_EMAIL", "bot@example.com"},
      {"GIT_COMMITTER_NAME", "Release Bot"},
      {"GIT_COMMITTER_EMAIL", "bot@example.com"},
  };
  return env;
}

// Run `git <args>` in `root`; status and stdout are returned as is.
inline relgate::ProcessResult git_result(const fs::path &root, std::vector<std::string> args) {
  args.insert(args.begin(), std::string(relgate::consts::kGitProgram));
  return relgate::run_process_capture(args, root, git_env());
}

// Run `git <args>` in `root` and return its stdout; throws on non-zero exit.
inline std::string git(const fs::path &root, const std::vector<std::string> &args) {
  auto res = git_result(root, args);
  if (res.status != 0) {
    std::string cmd = "git";
    for (const auto &a : args)
      cmd += " " + a;
    throw std::runtime_error("fixture: `" + cmd + "` exited with " + std::to_string(res.status));
  }
  return res.out;
}

inline std::string git_line(const fs::path &root, const std::vector<std::string> &args) {
  auto out = git(root, args);
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
    out.pop_back();
  return out;
}

// `git init` with HEAD on `branch`, whatever init.defaultBranch says.
inline relgate::Repository init_repo(const fs::path &root, std::string_view branch = "master") {
  fs::create_directories(root);
  git(root, {"init", "-q"});
  git(root, {"symbolic-ref", "HEAD", relgate::heads_ref(branch)});
  return relgate::Repository{root};
}

// Stage `paths` and commit them on the current branch. Returns the new commit id.
inline std::string commit_paths(const relgate::Repository &repo,
                                const std::vector<std::string> &paths,
                                std::string_view message = "commit") {
  std::vector<std::string> add{"add", "--"};
  add.insert(add.end(), paths.begin(), paths.end());
  git(repo.root(), add);
  git(repo.root(), {"commit", "-q", "-m", std::string(message)});
  const auto head = repo.head_commit();
  if (!head)
    throw std::runtime_error("fixture: HEAD does not resolve after commit");
  return *head;
}

// Annotated tag `name` on `target` (a commit or another tag). Returns the tag object id.
inline std::string annotated_tag(const relgate::Repository &repo, const std::string &name,
                                 const std::string &target) {
  git(repo.root(), {"tag", "-a", name, "-m", "Release " + name, target});
  return git_line(repo.root(), {"rev-parse", relgate::tags_ref(name)});
}

// Fresh repository on `branch` with a committed VERSION file.
inline relgate::Repository versioned_repo(const fs::path &root, std::string_view version,
                                          std::string_view branch = "master") {
  auto repo = init_repo(root, branch);
  write_file(root / "VERSION", std::string(version) + "\n");
  write_file(root / "README", "readme\n");
  commit_paths(repo, {"VERSION", "README"}, "initial");
  return repo;
}

} // namespace fixture
