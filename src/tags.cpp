#include "relgate/tags.hpp"

#include "relgate/consts.hpp"
#include "relgate/object_store.hpp"
#include "relgate/refs.hpp"
#include "relgate/repo.hpp"
#include "relgate/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace relgate {

std::string tag_name_for(std::string_view version, std::string_view prefix) {
  return std::string(prefix) + std::string(version);
}

bool is_valid_tag_name(std::string_view name) {
  if (name.empty() || name == "@") {
    return false;
  }
  if (name.front() == '-' || name.front() == '.' || name.front() == '/') {
    return false;
  }
  if (name.back() == '/' || name.back() == '.' || name.ends_with(".lock")) {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("@{") != std::string_view::npos ||
      name.find("//") != std::string_view::npos || name.find("/.") != std::string_view::npos) {
    return false;
  }
  for (const char c : name) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f) {
      return false;
    }
    switch (c) {
    case ' ':
    case '~':
    case '^':
    case ':':
    case '?':
    case '*':
    case '[':
    case '\\':
      return false;
    default:
      break;
    }
  }
  return true;
}

// Follow annotated tag objects until a non-tag object. nullopt if any hop is
// not a readable loose object, a tag has no usable `object` line, or the
// chain is longer than kMaxSymrefDepth. The tag still exists in those cases.
static std::optional<std::string> peel_loose(const Repository &repo, std::string hex) {
  const ObjectStore store{repo.objects_dir()};
  for (int depth = 0; depth <= consts::kMaxSymrefDepth; ++depth) {
    if (!store.contains(hex)) {
      return std::nullopt;
    }
    Object obj;
    try {
      obj = store.read(hex);
    } catch (const std::runtime_error &) {
      return std::nullopt; // corrupt or truncated loose object
    }
    if (obj.type != consts::kTypeTag) {
      if (obj.type != consts::kTypeCommit) {
        return std::nullopt; // tag of a tree or blob
      }
      return hex;
    }
    std::istringstream iss(std::string(obj.data.begin(), obj.data.end()));
    std::string line;
    std::string next;
    while (std::getline(iss, line) && !line.empty()) {
      if (line.starts_with(consts::kObjectPrefix)) {
        next = line.substr(consts::kObjectPrefix.size());
      }
    }
    if (!looks_hex40(next)) {
      return std::nullopt;
    }
    hex = std::move(next);
  }
  return std::nullopt;
}

std::optional<TagInfo> find_tag(const Repository &repo, std::string_view name) {
  const std::string refname = tags_ref(name);
  const auto target = read_ref(repo, refname);
  if (!target) {
    return std::nullopt;
  }

  TagInfo info{.name = std::string(name), .refname = refname, .target = *target, .commit = {}};

  // packed-refs may already carry the peeled id
  const auto packed = read_packed_refs(repo);
  if (const auto it = packed.find(refname);
      it != packed.end() && it->second.target == *target && it->second.peeled) {
    info.commit = it->second.peeled;
    return info;
  }
  info.commit = peel_loose(repo, *target);
  return info;
}

} // namespace relgate
