#pragma once
#include <string>
#include <vector>

namespace relgate {

class Repository; // fwd

// Tracked paths whose working copy differs from the index, in index order,
// as reported by `git ls-files -m` run in the working-tree root. git applies
// its own stat cache, split index, eol conversion and core.fileMode rules.
// Each unmerged path is listed once. Throws if git cannot be run or fails.
auto modified_files(const Repository& repo) -> std::vector<std::string>;

} // namespace relgate
