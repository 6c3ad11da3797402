#include "relgate/status.hpp"

#include "relgate/repo.hpp"

#include "fixture.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool lists(const std::vector<std::string> &xs, std::string_view path) {
  return std::ranges::find(xs, path) != xs.end();
}

int main() {
  const fixture::TempDir tmp{"relgate_status"};

  try {
    const auto repo = fixture::init_repo(tmp.path() / "plain");
    const fs::path root = repo.root();

    fixture::write_file(root / "a.txt", "hello\n");
    fixture::write_file(root / "b.txt", "B\n");
    fixture::write_file(root / "dir/c.txt", "C\n");
    fixture::write_file(root / "run.sh", "#!/bin/sh\n");
    fixture::commit_paths(repo, {"a.txt", "b.txt", "dir/c.txt", "run.sh"});

    // 1) Freshly committed tree is clean, untracked files do not count
    fixture::write_file(root / "untracked.txt", "U\n");
    if (const auto m = relgate::modified_files(repo); !m.empty()) {
      std::cerr << "expected clean tree, got " << m.front() << "\n";
      return 1;
    }

    // 2) Same-size content change
    fixture::write_file(root / "a.txt", "jello\n");
    // 3) Size change in a subdirectory
    fixture::write_file(root / "dir/c.txt", "CCC\n");
    // 4) Deletion
    fs::remove(root / "b.txt");
    {
      const auto m = relgate::modified_files(repo);
      const std::vector<std::string> want{"a.txt", "b.txt", "dir/c.txt"};
      if (m != want) {
        std::cerr << "unexpected modified list (" << m.size() << " entries)\n";
        return 1;
      }
    }

    // Restore without re-staging; clean again
    fixture::write_file(root / "a.txt", "hello\n");
    fixture::write_file(root / "b.txt", "B\n");
    fixture::write_file(root / "dir/c.txt", "C\n");
    if (!relgate::modified_files(repo).empty()) {
      std::cerr << "restored tree should be clean\n";
      return 1;
    }

    // 5) Executable bit flip
    fs::permissions(root / "run.sh", fs::perms::owner_exec, fs::perm_options::add);
    if (!lists(relgate::modified_files(repo), "run.sh")) {
      std::cerr << "mode change not reported\n";
      return 1;
    }

    // 6) ... which core.fileMode=false tells git to ignore
    fixture::git(root, {"config", "core.fileMode", "false"});
    if (const auto m = relgate::modified_files(repo); !m.empty()) {
      std::cerr << "core.fileMode=false: exec bit should not count, got " << m.front() << "\n";
      return 1;
    }
    fs::permissions(root / "run.sh", fs::perms::owner_exec, fs::perm_options::remove);

    // 7) assume-unchanged entries are not reported
    fixture::git(root, {"update-index", "--assume-unchanged", "a.txt"});
    fixture::write_file(root / "a.txt", "changed but assumed unchanged\n");
    if (const auto m = relgate::modified_files(repo); !m.empty()) {
      std::cerr << "assume-unchanged path reported: " << m.front() << "\n";
      return 1;
    }

    // 8) Split index: entries live in a shared index file
    {
      const auto split = fixture::init_repo(tmp.path() / "split");
      fixture::write_file(split.root() / "f.txt", "one\n");
      fixture::write_file(split.root() / "g.txt", "two\n");
      fixture::commit_paths(split, {"f.txt", "g.txt"});
      fixture::git(split.root(), {"update-index", "--split-index"});
      if (!relgate::modified_files(split).empty()) {
        std::cerr << "split index: clean tree reported dirty\n";
        return 1;
      }
      fixture::write_file(split.root() / "f.txt", "one, edited\n");
      if (relgate::modified_files(split) != std::vector<std::string>{"f.txt"}) {
        std::cerr << "split index: expected f.txt modified\n";
        return 1;
      }
    }

    // 9) eol=crlf checkout differs byte-wise from the blob but is clean
    {
      const auto crlf = fixture::init_repo(tmp.path() / "crlf");
      fixture::write_file(crlf.root() / ".gitattributes", "* text eol=crlf\n");
      fixture::write_file(crlf.root() / "t.txt", "line one\nline two\n");
      fixture::commit_paths(crlf, {".gitattributes", "t.txt"});
      fs::remove(crlf.root() / "t.txt");
      fixture::git(crlf.root(), {"checkout", "--", "t.txt"});
      if (fixture::slurp(crlf.root() / "t.txt") != "line one\r\nline two\r\n") {
        std::cerr << "eol=crlf: checkout did not convert line endings\n";
        return 1;
      }
      if (const auto m = relgate::modified_files(crlf); !m.empty()) {
        std::cerr << "eol=crlf: clean checkout reported dirty: " << m.front() << "\n";
        return 1;
      }
    }

    // 10) An unmerged path is listed once, not once per stage
    {
      const auto merge = fixture::init_repo(tmp.path() / "merge");
      const fs::path mroot = merge.root();
      fixture::write_file(mroot / "a.txt", "base\n");
      fixture::write_file(mroot / "z.txt", "z\n");
      fixture::commit_paths(merge, {"a.txt", "z.txt"}, "base");
      fixture::git(mroot, {"checkout", "-q", "-b", "side"});
      fixture::write_file(mroot / "a.txt", "side\n");
      fixture::commit_paths(merge, {"a.txt"}, "side");
      fixture::git(mroot, {"checkout", "-q", "master"});
      fixture::write_file(mroot / "a.txt", "main\n");
      fixture::commit_paths(merge, {"a.txt"}, "main");
      if (fixture::git_result(mroot, {"merge", "-q", "side"}).status == 0) {
        std::cerr << "merge was expected to conflict\n";
        return 1;
      }
      if (relgate::modified_files(merge) != std::vector<std::string>{"a.txt"}) {
        std::cerr << "expected only the unmerged path\n";
        return 1;
      }
    }

    // 11) git failing is an error, not a clean tree
    {
      const fs::path dangling = tmp.path() / "dangling";
      fixture::write_file(dangling / ".git", "gitdir: no-such-git-dir\n");
      const relgate::Repository broken{dangling};
      bool threw = false;
      try {
        (void)relgate::modified_files(broken);
      } catch (const std::runtime_error &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "git ls-files failure should throw\n";
        return 1;
      }
    }

    std::cout << "status OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
