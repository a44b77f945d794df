// Repository: MediaForge
// Component: Shell subprocess runner implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/SubprocessTranscodeRunner.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <sys/wait.h>
#include <unistd.h>

namespace mediaforge::transcode {

namespace {

// pclose() also waits for the shell, so an early exit never leaves a zombie.
struct PipeCloser {
  void operator()(FILE* pipe) const { pclose(pipe); }
};

}  // namespace

std::string SubprocessTranscodeRunner::QuoteArg(const std::string& arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

std::string SubprocessTranscodeRunner::JoinArgs(const std::vector<std::string>& argv) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& arg : argv) {
    if (!first) oss << ' ';
    first = false;
    oss << QuoteArg(arg);
  }
  return oss.str();
}

int SubprocessTranscodeRunner::Run(const std::vector<std::string>& argv,
                                   const OutputCallback& on_output) {
  if (argv.empty()) {
    throw std::invalid_argument("empty command line");
  }
  const std::string cmd = JoinArgs(argv) + " 2>&1";
  std::unique_ptr<FILE, PipeCloser> pipe(popen(cmd.c_str(), "r"));
  if (!pipe) {
    throw std::runtime_error("failed to start: " + argv.front());
  }

  // read(2) rather than fgets: the encoder rewrites its status line with '\r'.
  const int fd = fileno(pipe.get());
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      if (on_output) on_output(std::string(buffer.data(), static_cast<size_t>(n)));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }

  const int status = pclose(pipe.release());
  if (status == -1) {
    throw std::runtime_error("failed to reap: " + argv.front());
  }
  if (WIFEXITED(status)) {
    const int code = WEXITSTATUS(status);
    // 127 is the shell's "command not found".
    if (code == 127) throw std::runtime_error("command not found: " + argv.front());
    return code;
  }
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

}  // namespace mediaforge::transcode
