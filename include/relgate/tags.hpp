#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace relgate {

class Repository; // fwd

struct TagInfo {
  std::string name;                  // "1.2.0"
  std::string refname;               // "refs/tags/1.2.0"
  std::string target;                // 40-hex the ref points at (tag or commit object)
  std::optional<std::string> commit; // peeled commit, if it could be determined
};

// Tag name for a version: the prefix followed by the version itself.
std::string tag_name_for(std::string_view version, std::string_view prefix);

// Subset of git check-ref-format rules for a single tag name.
bool is_valid_tag_name(std::string_view name);

// Look up refs/tags/<name> and peel it to a commit where possible.
std::optional<TagInfo> find_tag(const Repository &repo, std::string_view name);

} // namespace relgate
