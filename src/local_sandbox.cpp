#include "launchpad/local_sandbox.hpp"

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>

#include "launchpad/process.hpp"

namespace fs = std::filesystem;

namespace launchpad {

namespace {

std::atomic<std::uint64_t> g_sandbox_seq{0};

// Confines `p` under `root`. Returns empty on escape.
std::string confine_under(const std::string &root, const std::string &p) {
  std::string rel = p;
  while (!rel.empty() && rel.front() == '/')
    rel.erase(rel.begin());
  if (rel.empty())
    return "";
  const fs::path norm = fs::path(rel).lexically_normal();
  if (norm.empty() || *norm.begin() == "..")
    return "";
  return (fs::path(root) / norm).string();
}

void signal_recorded_pids(const std::string &root) {
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec) || it->path().extension() != ".pid")
      continue;
    std::ifstream in(it->path());
    long pid = 0;
    if (!(in >> pid) || pid <= 1)
      continue;
    // Detached servers lead their own process group.
    kill(static_cast<pid_t>(-pid), SIGTERM);
    kill(static_cast<pid_t>(pid), SIGTERM);
  }
}

} // namespace

LocalSandbox::LocalSandbox(std::string id, std::string root,
                           std::map<std::string, std::string> env,
                           std::chrono::steady_clock::time_point expires_at,
                           LocalSandboxOptions options)
    : id_(std::move(id)), root_(std::move(root)), env_(std::move(env)),
      expires_at_(expires_at), options_(std::move(options)) {}

CommandResult LocalSandbox::run_command(const std::string &command,
                                        const CommandOptions &options) {
  CommandResult out;
  if (released_) {
    out.error_message = "sandbox " + id_ + " already released";
    return out;
  }
  const auto now = std::chrono::steady_clock::now();
  if (now >= expires_at_) {
    out.error_message = "sandbox " + id_ + " lifetime expired";
    return out;
  }
  const auto remaining_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(expires_at_ - now)
          .count());

  ProcessSpec spec;
  spec.command = options_.shell;
  spec.argv = {"-c", command};
  spec.env = env_;
  for (const auto &[k, v] : options.env)
    spec.env[k] = v;
  spec.cwd = root_;
  spec.timeout_ms = std::min(options.timeout_ms, remaining_ms);
  spec.max_output_bytes = options_.max_output_bytes;

  ProcessResult pr = run_process(spec);
  out.exit_code = pr.exit_code;
  out.timed_out = pr.timed_out;
  out.stdout_text = std::move(pr.stdout_text);
  out.stderr_text = std::move(pr.stderr_text);
  out.error_message = std::move(pr.error_message);
  return out;
}

std::optional<TransportError>
LocalSandbox::write_file(const std::string &path, const std::string &content) {
  if (released_)
    return TransportError{"sandbox " + id_ + " already released"};
  const std::string target = confine_under(root_, path);
  if (target.empty())
    return TransportError{"path escapes sandbox: " + path};

  std::error_code ec;
  fs::create_directories(fs::path(target).parent_path(), ec);
  if (ec)
    return TransportError{"mkdir failed for " + path + ": " + ec.message()};

  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return TransportError{"open failed for " + path};
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  ofs.flush();
  if (!ofs)
    return TransportError{"write failed for " + path};
  return std::nullopt;
}

std::string LocalSandbox::resolve_hostname(std::uint16_t port) {
  if (released_)
    return "";
  return options_.public_host + ":" + std::to_string(port);
}

std::optional<TransportError> LocalSandbox::release() {
  if (released_)
    return TransportError{"sandbox " + id_ + " already released"};
  released_ = true;
  signal_recorded_pids(root_);
  std::error_code ec;
  fs::remove_all(root_, ec);
  if (ec)
    return TransportError{"remove " + root_ + " failed: " + ec.message()};
  return std::nullopt;
}

LocalSandboxProvider::LocalSandboxProvider(LocalSandboxOptions options)
    : options_(std::move(options)) {
  if (options_.base_dir.empty()) {
    std::error_code ec;
    const fs::path tmp = fs::temp_directory_path(ec);
    options_.base_dir = ((ec ? fs::path("/tmp") : tmp) / "launchpad").string();
  }
}

std::unique_ptr<IRemoteExecutor>
LocalSandboxProvider::allocate(const AllocateOptions &options,
                               std::string *error) {
  auto fail = [&](const std::string &msg) -> std::unique_ptr<IRemoteExecutor> {
    if (error)
      *error = msg;
    return nullptr;
  };
  if (options.run_as_root && ::geteuid() != 0)
    return fail("root privileges requested but the local provider runs "
                "unprivileged");
  if (options.timeout_ms == 0)
    return fail("allocation timeout must be positive");
  if (options.timeout_ms > kMaxTimeoutMs)
    return fail("allocation timeout exceeds " + std::to_string(kMaxTimeoutMs) +
                " ms");

  const std::string id =
      "lsb-" + std::to_string(static_cast<long>(::getpid())) + "-" +
      std::to_string(g_sandbox_seq.fetch_add(1, std::memory_order_relaxed));
  const fs::path root = fs::path(options_.base_dir) / id;

  std::error_code ec;
  fs::create_directories(options_.base_dir, ec);
  if (ec)
    return fail("cannot create " + options_.base_dir + ": " + ec.message());
  fs::remove_all(root, ec);
  if (!fs::create_directory(root, ec) || ec)
    return fail("cannot create sandbox directory " + root.string());

  const auto expires_at = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options.timeout_ms);
  return std::make_unique<LocalSandbox>(id, root.string(), options.env,
                                        expires_at, options_);
}

} // namespace launchpad
