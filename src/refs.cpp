#include "relgate/refs.hpp"

#include "relgate/consts.hpp"
#include "relgate/fs.hpp"
#include "relgate/repo.hpp"
#include "relgate/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace relgate {

namespace gfs = relgate::fs;

// HEAD is per-worktree; everything else lives in the common dir.
static std::filesystem::path ref_path(const Repository &repo, const std::string &refname) {
  if (refname == consts::kHeadFile) {
    return repo.head_file();
  }
  if (refname.empty() || refname.find("..") != std::string::npos || refname.front() == '/') {
    throw std::runtime_error("refusing suspicious ref name: " + refname);
  }
  return repo.common_dir() / refname;
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsRefPrefix) + std::string(branch);
}

std::string tags_ref(std::string_view tag) {
  return std::string(consts::kTagsRefPrefix) + std::string(tag);
}

std::optional<std::string> read_HEAD(const Repository &repo) {
  const auto p = repo.head_file();
  if (!gfs::exists(p)) {
    return std::nullopt;
  }
  return gfs::read_text(p);
}

std::optional<std::string> head_symbolic_ref(const Repository &repo) {
  auto head = read_HEAD(repo);
  if (!head) {
    return std::nullopt;
  }
  std::string s = strutil::trim(*head);
  if (s.starts_with(consts::kRefPrefix)) {
    return strutil::trim(std::string_view(s).substr(consts::kRefPrefix.size()));
  }
  return std::nullopt;
}

std::map<std::string, PackedRef> read_packed_refs(const Repository &repo) {
  std::map<std::string, PackedRef> out;
  const auto p = repo.packed_refs_file();
  if (!gfs::exists(p)) {
    return out;
  }

  std::istringstream iss(gfs::read_text(p));
  std::string line;
  std::string last;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#') {
      continue; // header: "# pack-refs with: peeled fully-peeled sorted"
    }
    if (line[0] == consts::kPeeledMarker) {
      const std::string hex = line.substr(1);
      if (last.empty() || !looks_hex40(hex)) {
        throw std::runtime_error("packed-refs: bad peeled line " + std::to_string(lineno));
      }
      out[last].peeled = hex;
      continue;
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos || !looks_hex40(std::string_view(line).substr(0, sp))) {
      throw std::runtime_error("packed-refs: malformed line " + std::to_string(lineno));
    }
    last = line.substr(sp + 1);
    out[last] = PackedRef{.target = line.substr(0, sp), .peeled = std::nullopt};
  }
  return out;
}

static std::optional<std::string> resolve_ref(const Repository &repo, const std::string &refname,
                                              int depth) {
  if (depth > consts::kMaxSymrefDepth) {
    throw std::runtime_error("symbolic ref chain too deep at " + refname);
  }

  const auto p = ref_path(repo, refname);
  std::error_code ec;
  if (std::filesystem::is_regular_file(p, ec)) {
    std::string s = strutil::trim(gfs::read_text(p));
    if (s.starts_with(consts::kRefPrefix)) {
      return resolve_ref(repo, strutil::trim(std::string_view(s).substr(consts::kRefPrefix.size())),
                         depth + 1);
    }
    if (!looks_hex40(s)) {
      throw std::runtime_error("malformed ref " + refname);
    }
    return s;
  }

  const auto packed = read_packed_refs(repo);
  if (const auto it = packed.find(refname); it != packed.end()) {
    return it->second.target;
  }
  return std::nullopt;
}

std::optional<std::string> read_ref(const Repository &repo, const std::string &refname) {
  return resolve_ref(repo, refname, 0);
}

void update_ref(const Repository &repo, const std::string &refname, const std::string &hex_oid) {
  if (!looks_hex40(hex_oid)) {
    throw std::runtime_error("update_ref: bad oid for " + refname);
  }
  gfs::write_text_atomic(ref_path(repo, refname), hex_oid + "\n");
}

void set_HEAD_symbolic(const Repository &repo, const std::string &refname) {
  gfs::write_text_atomic(repo.head_file(), std::string(consts::kRefPrefix) + refname + "\n");
}

void set_HEAD_detached(const Repository &repo, std::string_view hex_oid) {
  gfs::write_text_atomic(repo.head_file(), std::string(hex_oid) + "\n");
}

} // namespace relgate
