#include "relgate/process.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace relgate {

namespace {

[[noreturn]] void throw_errno(const char *what) {
  throw std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
}

// Fork and exec argv. When out_fd >= 0 the child's stdout is redirected to it
// and close_fd (the parent's end of the pipe) is closed in the child.
pid_t spawn(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
            const EnvVars &extra_env, int out_fd, int close_fd) {
  if (argv.empty()) {
    throw std::runtime_error("run_process: empty command");
  }

  // Everything the child touches is prepared before fork().
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);
  const std::string dir = cwd.string();

  // Keep buffered output ordered ahead of the child's.
  std::cout.flush();
  std::cerr.flush();

  const pid_t pid = fork();
  if (pid < 0) {
    throw_errno("fork");
  }
  if (pid == 0) {
    if (out_fd >= 0) {
      if (close_fd >= 0) {
        close(close_fd);
      }
      if (dup2(out_fd, STDOUT_FILENO) < 0) {
        _exit(kExecFailedStatus);
      }
      close(out_fd);
    }
    if (!dir.empty() && chdir(dir.c_str()) != 0) {
      _exit(kExecFailedStatus);
    }
    for (const auto &[key, value] : extra_env) {
      if (setenv(key.c_str(), value.c_str(), 1) != 0) {
        _exit(kExecFailedStatus);
      }
    }
    execvp(args[0], args.data());
    _exit(kExecFailedStatus);
  }
  return pid;
}

int wait_for(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw_errno("waitpid");
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 1;
}

} // namespace

int run_process(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
                const EnvVars &extra_env) {
  return wait_for(spawn(argv, cwd, extra_env, -1, -1));
}

ProcessResult run_process_capture(const std::vector<std::string> &argv,
                                  const std::filesystem::path &cwd, const EnvVars &extra_env) {
  int fds[2];
  if (pipe(fds) != 0) {
    throw_errno("pipe");
  }

  pid_t pid = -1;
  try {
    pid = spawn(argv, cwd, extra_env, fds[1], fds[0]);
  } catch (const std::runtime_error &) {
    close(fds[0]);
    close(fds[1]);
    throw;
  }
  close(fds[1]);

  ProcessResult res;
  std::array<char, 4096> buf{};
  for (;;) {
    const ssize_t n = read(fds[0], buf.data(), buf.size());
    if (n > 0) {
      res.out.append(buf.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    const int saved = errno;
    close(fds[0]);
    wait_for(pid);
    errno = saved;
    throw_errno("read");
  }
  close(fds[0]);

  res.status = wait_for(pid);
  return res;
}

} // namespace relgate
