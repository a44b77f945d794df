// Repository: MediaForge
// Component: Encoder process interface
// Purpose: Runs one encoder invocation and streams its diagnostic output,
//          which is the source of transcode progress.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_I_TRANSCODE_RUNNER_HPP_
#define MEDIAFORGE_TRANSCODE_I_TRANSCODE_RUNNER_HPP_

#include <functional>
#include <string>
#include <vector>

namespace mediaforge::transcode {

using OutputCallback = std::function<void(const std::string& bytes)>;

class ITranscodeRunner {
 public:
  virtual ~ITranscodeRunner() = default;

  // Runs argv[0] with the remaining arguments, calling on_output with output
  // bytes as they arrive. Blocks until exit and returns the exit code.
  // Throws std::runtime_error if the process cannot be started.
  virtual int Run(const std::vector<std::string>& argv, const OutputCallback& on_output) = 0;
};

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_I_TRANSCODE_RUNNER_HPP_
