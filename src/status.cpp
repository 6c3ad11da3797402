#include "relgate/status.hpp"

#include "relgate/consts.hpp"
#include "relgate/process.hpp"
#include "relgate/repo.hpp"

#include <stdexcept>
#include <string_view>

namespace relgate {

std::vector<std::string> modified_files(const Repository &repo) {
  // -z: NUL-terminated, unquoted paths.
  const std::vector<std::string> argv{std::string(consts::kGitProgram), "ls-files", "-m", "-z"};
  const ProcessResult res = run_process_capture(argv, repo.root());
  if (res.status == kExecFailedStatus) {
    throw std::runtime_error("unable to run git ls-files (is git installed?)");
  }
  if (res.status != 0) {
    throw std::runtime_error("git ls-files -m exited with code " + std::to_string(res.status));
  }

  std::vector<std::string> out;
  std::string_view rest{res.out};
  while (!rest.empty()) {
    const auto nul = rest.find(consts::kNul);
    const std::string_view path = rest.substr(0, nul);
    rest = nul == std::string_view::npos ? std::string_view{} : rest.substr(nul + 1);
    if (path.empty()) {
      continue;
    }
    // Unmerged paths come once per conflict stage.
    if (!out.empty() && out.back() == path) {
      continue;
    }
    out.emplace_back(path);
  }
  return out;
}

} // namespace relgate
