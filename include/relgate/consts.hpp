#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace relgate::consts {

// Directory and file names inside a git directory
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kPackedRefs    = "packed-refs";
inline constexpr std::string_view kCommonDirFile = "commondir";
inline constexpr std::string_view kReftableDir   = "reftable";

// Ref namespaces
inline constexpr std::string_view kHeadsRefPrefix = "refs/heads/";
inline constexpr std::string_view kTagsRefPrefix  = "refs/tags/";

// Gate defaults
inline constexpr std::string_view kGitProgram         = "git";
inline constexpr std::string_view kConfigFile         = ".relgate";
inline constexpr std::string_view kDefaultBranch      = "master";
inline constexpr std::string_view kDefaultVersionFile = "VERSION";
inline constexpr std::string_view kDefaultTagHelper   = "scripts/tag.sh";

// Environment handed to the tagging helper
inline constexpr std::string_view kEnvProject = "RELGATE_PROJECT";
inline constexpr std::string_view kEnvVersion = "RELGATE_VERSION";
inline constexpr std::string_view kEnvTag     = "RELGATE_TAG";

// Git object type strings
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kShortHexLen = 7;

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Header prefixes (used in parsing) ———
inline constexpr std::string_view kRefPrefix    = "ref: ";
inline constexpr std::string_view kGitDirPrefix = "gitdir: ";
inline constexpr std::string_view kObjectPrefix = "object ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kPeeledMarker = '^';

// Symbolic ref chains deeper than this are treated as broken
inline constexpr int kMaxSymrefDepth = 5;

} // namespace relgate::consts
