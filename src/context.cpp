#include "launchpad/context.hpp"

namespace launchpad {

std::uint64_t ProvisionContext::elapsed_ms() const {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - start)
                                        .count());
}

StageLog& ProvisionContext::record(const std::string& step, const CommandResult& result,
                                   std::string note_text) {
  StageLog entry;
  entry.stage = current_stage;
  entry.step = step;
  entry.exit_code = result.exit_code;
  entry.stdout_text = result.stdout_text;
  entry.stderr_text = result.stderr_text;
  if (result.transport_failed()) {
    entry.note = "transport: " + result.error_message;
  } else if (result.timed_out) {
    entry.note = "timed out";
  }
  if (!note_text.empty()) {
    entry.note = entry.note.empty() ? std::move(note_text) : entry.note + "; " + note_text;
  }
  logs.push_back(std::move(entry));
  return logs.back();
}

StageLog& ProvisionContext::note(const std::string& step, std::string text, int exit_code) {
  StageLog entry;
  entry.stage = current_stage;
  entry.step = step;
  entry.exit_code = exit_code;
  entry.note = std::move(text);
  logs.push_back(std::move(entry));
  return logs.back();
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back(std::move(line));
    start = nl + 1;
  }
  return out;
}

std::string tail_lines(const std::string& text, std::size_t n) {
  const std::vector<std::string> lines = split_lines(text);
  const std::size_t from = lines.size() > n ? lines.size() - n : 0;
  std::string out;
  for (std::size_t i = from; i < lines.size(); ++i) {
    if (!out.empty()) out += '\n';
    out += lines[i];
  }
  return out;
}

}  // namespace launchpad
