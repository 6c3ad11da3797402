#pragma once
#include "relgate/consts.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace relgate {

class Repository {
public:
  // `root` is the working-tree root. The git directory is resolved from
  // root/.git, which may be a directory or a "gitdir: <path>" file.
  explicit Repository(std::filesystem::path root);

  // Walk up from `start` to the first directory holding a .git entry.
  // Throws std::runtime_error if there is none.
  static auto discover(const std::filesystem::path &start) -> Repository;

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return git_dir_; }
  // Shared by linked worktrees; equals git_dir() otherwise.
  [[nodiscard]] const std::filesystem::path &common_dir() const { return common_dir_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto packed_refs_file() const -> std::filesystem::path {
    return common_dir_ / consts::kPackedRefs;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir_ / consts::kHeadFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return root_ / consts::kConfigFile;
  }

  // Create a minimal repository skeleton under root_ with HEAD on `branch`.
  // Fails if .git already exists (to avoid clobber).
  void init(std::string_view branch = consts::kDefaultBranch) const;

  [[nodiscard]] auto is_initialized() const -> bool;

  // Branch name HEAD points at, or nullopt when HEAD is detached or missing.
  [[nodiscard]] auto current_branch() const -> std::optional<std::string>;

  // 40-hex commit HEAD resolves to, or nullopt on an unborn branch.
  [[nodiscard]] auto head_commit() const -> std::optional<std::string>;

private:
  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
};

} // namespace relgate
