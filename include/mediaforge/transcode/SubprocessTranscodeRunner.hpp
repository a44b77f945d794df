// Repository: MediaForge
// Component: Shell subprocess runner
// Purpose: ITranscodeRunner over popen(); stderr is folded into the stream.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_SUBPROCESS_TRANSCODE_RUNNER_HPP_
#define MEDIAFORGE_TRANSCODE_SUBPROCESS_TRANSCODE_RUNNER_HPP_

#include <string>
#include <vector>

#include "mediaforge/transcode/ITranscodeRunner.hpp"

namespace mediaforge::transcode {

class SubprocessTranscodeRunner : public ITranscodeRunner {
 public:
  int Run(const std::vector<std::string>& argv, const OutputCallback& on_output) override;

  // Single-quotes each argument for /bin/sh.
  static std::string QuoteArg(const std::string& arg);
  static std::string JoinArgs(const std::vector<std::string>& argv);
};

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_SUBPROCESS_TRANSCODE_RUNNER_HPP_
