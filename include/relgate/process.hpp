#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace relgate {

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Exit status when the program could not be executed at all
inline constexpr int kExecFailedStatus = 127;

struct ProcessResult {
  int status = 0;
  std::string out; // everything the child wrote to stdout
};

// Run argv[0] (PATH lookup applies) in `cwd` with `extra_env` added to the
// inherited environment. Blocks until it exits and returns its exit status;
// a signal death returns 128 + signal number. stdio is inherited.
int run_process(const std::vector<std::string>& argv,
                const std::filesystem::path& cwd,
                const EnvVars& extra_env = {});

// Same as run_process, but the child's stdout is read into the result.
// stderr stays inherited.
ProcessResult run_process_capture(const std::vector<std::string>& argv,
                                  const std::filesystem::path& cwd,
                                  const EnvVars& extra_env = {});

} // namespace relgate
