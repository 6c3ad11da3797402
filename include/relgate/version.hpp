#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace relgate {

// Read the project version from `root / version_file`.
// With an empty `pattern` the first non-blank, non-'#' line is the version.
// Otherwise `pattern` is an ECMAScript regex; capture group 1 (or the whole
// match when there are no groups) is the version.
// Throws std::runtime_error if no version can be resolved.
std::string read_version(const std::filesystem::path &root,
                         const std::filesystem::path &version_file,
                         std::string_view pattern = {});

} // namespace relgate
