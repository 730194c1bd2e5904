#include "launchpad/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

extern char **environ;

namespace launchpad {

namespace {
void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

// Reads everything currently available on a non-blocking fd.
void drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  char buf[4096];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    return;
  }
}

std::map<std::string, std::string> build_env(const ProcessSpec &spec) {
  std::map<std::string, std::string> env;
  if (spec.inherit_env && environ != nullptr) {
    for (char **e = environ; *e != nullptr; ++e) {
      const char *eq = std::strchr(*e, '=');
      if (eq == nullptr)
        continue;
      env[std::string(*e, static_cast<std::size_t>(eq - *e))] = std::string(eq + 1);
    }
  }
  for (const auto &[k, v] : spec.env)
    env[k] = v;
  return env;
}
} // namespace

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  if (pipe(err_pipe) != 0) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return result;
  }

  // Built before fork: no allocation in the child.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  for (const auto &[k, v] : build_env(spec))
    envs.push_back(k + "=" + v);
  std::vector<char *> envp;
  envp.reserve(envs.size() + 1);
  for (auto &e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    setsid();
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0)
        _exit(127);
    }

    execve(spec.command.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline =
      std::chrono::steady_clock::now() +
      std::chrono::milliseconds(std::min(spec.timeout_ms, kMaxProcessTimeoutMs));
  int status = 0;
  while (true) {
    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
          result.stdout_truncated);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
          result.stderr_truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (w < 0 && errno != EINTR) {
      result.error_message =
          std::string("waitpid failed: ") + std::strerror(errno);
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  // Whatever the child left in the pipes. A detached grandchild may still
  // hold the write end, so this never blocks.
  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
        result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
        result.stderr_truncated);
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.stdout_truncated)
    result.stdout_text += "(truncated)";
  if (result.stderr_truncated)
    result.stderr_text += "(truncated)";

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace launchpad
