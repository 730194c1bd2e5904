#include "launchpad/startup_script.hpp"

#include <sstream>

namespace launchpad {

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

std::string render_startup_script(const StartupScriptSpec& spec) {
  const std::string pattern = shell_quote(spec.target.process_pattern);
  const std::string venv = shell_quote(spec.venv_dir);
  const std::string env_file = shell_quote(spec.env_file);
  const std::string pid_file = shell_quote(spec.pid_file);
  const std::string log_file = shell_quote(spec.log_file);
  const std::string cli = shell_quote(spec.framework_cli);

  std::ostringstream o;
  o << "#!/bin/bash\n"
    << "# Generated by launchpad. Restarts the agent server and waits for port "
    << spec.target.port << ".\n"
    << "SCRIPT_DIR=\"$(cd \"$(dirname \"${BASH_SOURCE[0]}\")\" && pwd)\"\n"
    << "cd \"$SCRIPT_DIR\" || exit 1\n"
    << "\n"
    << "if [ -f " << venv << "/bin/activate ]; then\n"
    << "  source " << venv << "/bin/activate\n"
    << "else\n"
    << "  echo \"isolated environment missing: " << spec.venv_dir << "\" >&2\n"
    << "  exit 1\n"
    << "fi\n"
    << "\n"
    << "if [ -f " << env_file << " ]; then\n"
    << "  set -a\n"
    << "  . ./" << env_file << "\n"
    << "  set +a\n"
    << "fi\n"
    << "\n"
    << "if ! command -v " << cli << " >/dev/null 2>&1; then\n"
    << "  echo \"" << spec.framework_cli << " not on PATH, reinstalling "
    << spec.framework_package << "\"\n"
    << "  pip install --upgrade " << shell_quote(spec.framework_package)
    << " || { echo \"reinstall failed\" >&2; exit 1; }\n"
    << "  command -v " << cli << " >/dev/null 2>&1 || { echo \""
    << spec.framework_cli << " still missing after reinstall\" >&2; exit 1; }\n"
    << "fi\n"
    << "\n"
    << "# Stop any previous instance.\n"
    << "if [ -f " << pid_file << " ]; then\n"
    << "  old_pid=$(cat " << pid_file << " 2>/dev/null)\n"
    << "  if [ -n \"$old_pid\" ] && kill -0 \"$old_pid\" 2>/dev/null; then\n"
    << "    kill \"$old_pid\" 2>/dev/null\n"
    << "  fi\n"
    << "  rm -f " << pid_file << "\n"
    << "fi\n"
    << "pkill -f " << pattern << " 2>/dev/null\n"
    << "for ((i=1; i<=" << spec.stop_wait_seconds << "; i++)); do\n"
    << "  pgrep -f " << pattern << " >/dev/null 2>&1 || break\n"
    << "  sleep 1\n"
    << "done\n"
    << "pgrep -f " << pattern << " >/dev/null 2>&1 && pkill -9 -f " << pattern
    << " 2>/dev/null\n"
    << "\n"
    << "if command -v setsid >/dev/null 2>&1; then\n"
    << "  setsid nohup " << spec.server_command << " > " << log_file
    << " 2>&1 < /dev/null &\n"
    << "else\n"
    << "  nohup " << spec.server_command << " > " << log_file
    << " 2>&1 < /dev/null &\n"
    << "fi\n"
    << "echo $! > " << pid_file << "\n"
    << "disown 2>/dev/null || true\n"
    << "\n"
    << render_check_function(spec.target)
    << "\n"
    << "for ((i=1; i<=" << spec.attempts << "; i++)); do\n"
    << "  if check_port; then\n"
    << "    echo \"server started (pid $(cat " << pid_file << "), attempt $i)\"\n"
    << "    exit 0\n"
    << "  fi\n"
    << "  sleep " << spec.spacing_seconds << "\n"
    << "done\n"
    << "\n"
    << "echo \"server not reachable on port " << spec.target.port << " after "
    << spec.attempts << " attempts\" >&2\n"
    << "echo \"--- " << spec.log_file << " (last " << spec.log_tail_lines
    << " lines) ---\" >&2\n"
    << "tail -n " << spec.log_tail_lines << " " << log_file << " >&2 2>/dev/null\n"
    << "exit 1\n";
  return o.str();
}

}  // namespace launchpad
