#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace relgate {

class Repository; // fwd

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// "refs/tags/<tag>"
std::string tags_ref(std::string_view tag);

// Read HEAD file as raw string (e.g., "ref: refs/heads/master\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist yet.
std::optional<std::string> read_HEAD(const Repository &repo);

// Refname HEAD points at when symbolic, nullopt when detached or missing.
std::optional<std::string> head_symbolic_ref(const Repository &repo);

struct PackedRef {
  std::string target;                // 40-hex
  std::optional<std::string> peeled; // from a following "^<hex>" line
};

// Parse packed-refs; an absent file yields an empty map.
std::map<std::string, PackedRef> read_packed_refs(const Repository &repo);

// Resolve a ref (e.g., "refs/tags/1.2.0") -> 40-hex OID.
// Loose refs win over packed-refs; symbolic refs are followed.
std::optional<std::string> read_ref(const Repository &repo, const std::string &refname);

// Overwrite/create a loose ref with the given 40-hex OID (adds trailing newline on disk).
void update_ref(const Repository &repo, const std::string &refname, const std::string &hex_oid);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const Repository &repo, const std::string &refname);

void set_HEAD_detached(const Repository &repo, std::string_view hex_oid);

} // namespace relgate
