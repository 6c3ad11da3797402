#include "relgate/repo.hpp"

#include "relgate/consts.hpp"
#include "relgate/fs.hpp"
#include "relgate/refs.hpp"
#include "relgate/util.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace stdfs = std::filesystem;
namespace gfs   = relgate::fs;

namespace {

// lexically_normal() keeps a trailing separator ("a/b/.." -> "a/"); drop it
// so equal directories compare equal.
[[nodiscard]] auto normalize_dir(const stdfs::path &p) -> stdfs::path {
  stdfs::path n = p.lexically_normal();
  if (!n.has_filename() && n.has_relative_path()) {
    n = n.parent_path();
  }
  return n;
}

// ".git" as a file: "gitdir: <path>", relative to the directory holding it
[[nodiscard]] auto read_gitfile(const stdfs::path &gitfile) -> stdfs::path {
  const std::string text = relgate::strutil::trim(gfs::read_text(gitfile));
  if (!text.starts_with(relgate::consts::kGitDirPrefix)) {
    throw std::runtime_error("invalid gitfile format: " + gitfile.string());
  }
  const stdfs::path target{text.substr(relgate::consts::kGitDirPrefix.size())};
  if (target.is_absolute()) {
    return normalize_dir(target);
  }
  return normalize_dir(gitfile.parent_path() / target);
}

} // namespace

namespace relgate {

Repository::Repository(stdfs::path root)
    : root_(std::move(root)), git_dir_(root_ / consts::kGitDir) {
  std::error_code ec;
  if (stdfs::is_regular_file(git_dir_, ec)) {
    git_dir_ = read_gitfile(git_dir_);
  }

  common_dir_ = git_dir_;
  const auto commondir = git_dir_ / consts::kCommonDirFile;
  if (gfs::exists(commondir)) {
    const stdfs::path p{strutil::trim(gfs::read_text(commondir))};
    common_dir_ = normalize_dir(p.is_absolute() ? p : git_dir_ / p);
  }

  if (stdfs::is_directory(common_dir_ / consts::kReftableDir, ec)) {
    throw std::runtime_error("reftable ref storage is not supported: " + common_dir_.string());
  }
}

auto Repository::discover(const stdfs::path &start) -> Repository {
  std::error_code ec;
  stdfs::path dir = stdfs::absolute(start, ec);
  if (ec) {
    throw std::runtime_error("cannot resolve path " + start.string() + ": " + ec.message());
  }
  dir = dir.lexically_normal();
  while (true) {
    if (gfs::exists(dir / consts::kGitDir)) {
      return Repository{dir};
    }
    const auto parent = dir.parent_path();
    if (parent == dir || parent.empty()) {
      break;
    }
    dir = parent;
  }
  throw std::runtime_error("not a git repository (or any of the parent directories): " +
                           start.string());
}

auto Repository::is_initialized() const -> bool { return gfs::exists(head_file()); }

void Repository::init(std::string_view branch) const {
  if (gfs::exists(root_ / consts::kGitDir)) {
    throw std::runtime_error("A git repository already exists at: " + git_dir_.string());
  }

  std::error_code ec;
  stdfs::create_directories(objects_dir(), ec);
  if (ec) {
    throw std::runtime_error("create objects dir failed: " + ec.message());
  }
  stdfs::create_directories(heads_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/heads dir failed: " + ec.message());
  }
  stdfs::create_directories(tags_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/tags dir failed: " + ec.message());
  }

  set_HEAD_symbolic(*this, heads_ref(branch));
}

auto Repository::current_branch() const -> std::optional<std::string> {
  const auto ref = head_symbolic_ref(*this);
  if (!ref) {
    return std::nullopt;
  }
  if (ref->starts_with(consts::kHeadsRefPrefix)) {
    return ref->substr(consts::kHeadsRefPrefix.size());
  }
  return ref;
}

auto Repository::head_commit() const -> std::optional<std::string> {
  if (const auto ref = head_symbolic_ref(*this)) {
    return read_ref(*this, *ref);
  }
  auto head = read_HEAD(*this);
  if (!head) {
    return std::nullopt;
  }
  std::string hex = strutil::trim(*head);
  if (!looks_hex40(hex)) {
    throw std::runtime_error("HEAD is neither a symbolic ref nor an object id");
  }
  return hex;
}

} // namespace relgate
