#include "drover/tools/builtin/shell.hpp"

#include <array>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace drover::tools {

namespace {

class OutputCollector {
public:
  OutputCollector(std::size_t limit, const ToolOutputCallback &on_output)
      : limit_(limit), on_output_(on_output) {}

  void append(const char *data, std::size_t len) {
    if (on_output_) {
      on_output_(std::string_view(data, len));
    }
    const std::size_t room = limit_ > output_.size() ? limit_ - output_.size() : 0;
    const std::size_t keep = std::min(room, len);
    output_.append(data, keep);
    if (keep < len) {
      truncated_ = true;
    }
  }

  [[nodiscard]] std::string take() { return std::move(output_); }
  [[nodiscard]] bool truncated() const { return truncated_; }

private:
  std::size_t limit_;
  const ToolOutputCallback &on_output_;
  std::string output_;
  bool truncated_ = false;
};

bool drain(int fd, OutputCollector &collector) {
  std::array<char, 4096> buffer{};
  bool any = false;
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes <= 0) {
      return any;
    }
    any = true;
    collector.append(buffer.data(), static_cast<std::size_t>(bytes));
  }
}

} // namespace

ShellTool::ShellTool(const std::uint32_t timeout_ms, const std::size_t max_output_bytes)
    : timeout_ms_(timeout_ms), max_output_bytes_(max_output_bytes) {}

std::string_view ShellTool::name() const { return "run_shell_command"; }

std::string_view ShellTool::description() const {
  return "Execute a shell command in the workspace and return its combined stdout and stderr";
}

std::string ShellTool::parameters_schema() const {
  return R"({"type":"object","required":["command"],"properties":{"command":{"type":"string","description":"Command line passed to /bin/sh -c"},"description":{"type":"string"}}})";
}

common::Result<ToolResult> ShellTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto command = arg_string(args, "command");
  if (!command.has_value() || command->empty()) {
    return common::Result<ToolResult>::failure("Missing argument: command");
  }

  int pipefd[2] = {-1, -1};
  if (pipe(pipefd) != 0) {
    return common::Result<ToolResult>::failure("Failed to create pipe");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    return common::Result<ToolResult>::failure("Failed to fork");
  }

  if (pid == 0) {
    // Own process group so cancellation can kill the whole pipeline.
    setpgid(0, 0);
    close(pipefd[0]);
    dup2(pipefd[1], STDOUT_FILENO);
    dup2(pipefd[1], STDERR_FILENO);
    close(pipefd[1]);
    if (!ctx.workspace_path.empty() && chdir(ctx.workspace_path.c_str()) != 0) {
      _exit(126);
    }
    execl("/bin/sh", "sh", "-c", command->c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  close(pipefd[1]);
  const int flags = fcntl(pipefd[0], F_GETFL, 0);
  fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

  OutputCollector collector(max_output_bytes_, ctx.on_output);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
  bool timed_out = false;
  bool cancelled = false;
  int status = 0;

  while (true) {
    if (ctx.cancel.cancelled()) {
      cancelled = true;
    } else if (std::chrono::steady_clock::now() > deadline) {
      timed_out = true;
    }
    if (cancelled || timed_out) {
      kill(-pid, SIGKILL);
      waitpid(pid, &status, 0);
      break;
    }

    pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
    (void)poll(&pfd, 1, 50);
    drain(pipefd[0], collector);

    if (waitpid(pid, &status, WNOHANG) == pid) {
      break;
    }
  }

  drain(pipefd[0], collector);
  close(pipefd[0]);

  ToolResult result;
  result.truncated = collector.truncated();
  result.output = collector.take();
  if (cancelled) {
    result.success = false;
    result.metadata["cancelled"] = "true";
    result.output += "\n[command cancelled]";
  } else if (timed_out) {
    result.success = false;
    result.output += "\n[command timed out after " + std::to_string(timeout_ms_) + "ms]";
  } else {
    result.success = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    result.metadata["exit_code"] =
        WIFEXITED(status) ? std::to_string(WEXITSTATUS(status)) : "signal";
  }
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace drover::tools
