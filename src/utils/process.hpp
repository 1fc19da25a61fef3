#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

struct ProcessResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

class ProcessError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Run `cmd` (a path when it contains '/', otherwise looked up in PATH) with `args`, feed `input` on stdin and
// collect stdout and stderr. The child is killed when it runs longer than
// `timeout`. Throws ProcessError when the command cannot be started or
// times out. A non-zero exit code is reported, not thrown.
ProcessResult run_process(const std::string &cmd,
                          const std::vector<std::string> &args,
                          const std::string &input,
                          std::chrono::milliseconds timeout);

// Full path of `cmd`, resolved like run_process() does, or an empty string.
std::string find_executable(const std::string &cmd);
