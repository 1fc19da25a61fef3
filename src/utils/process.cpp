#include "process.hpp"
#include "logging.hpp"

#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <future>
#include <sstream>
#include <unistd.h>

namespace bp = boost::process;

namespace {

std::string unfold(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (const auto &arg : args) {
    out << " " << arg;
  }
  return out.str();
}

// A command with a directory part is used as given, anything else is looked
// up in PATH. Empty when there is no such executable.
boost::filesystem::path resolve_command(const std::string &cmd) {
  if (cmd.find('/') == std::string::npos) {
    return bp::search_path(cmd);
  }

  const boost::filesystem::path exe(cmd);
  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(exe, ec) ||
      ::access(exe.c_str(), X_OK) != 0) {
    return {};
  }
  return exe;
}

} // namespace

std::string find_executable(const std::string &cmd) {
  return resolve_command(cmd).string();
}

ProcessResult run_process(const std::string &cmd,
                          const std::vector<std::string> &args,
                          const std::string &input,
                          std::chrono::milliseconds timeout) {
  const auto exe = resolve_command(cmd);
  if (exe.empty()) {
    throw ProcessError("command not found: " + cmd);
  }

  LOG_DEBUG << "Running command: " << cmd << unfold(args);

  boost::asio::io_context ios;
  std::future<std::string> out;
  std::future<std::string> err;

  bp::child child;
  try {
    child = bp::child(exe, bp::args(args),
                      bp::std_in < boost::asio::buffer(input),
                      bp::std_out > out, bp::std_err > err, ios);
  } catch (const bp::process_error &e) {
    throw ProcessError("failed to start " + cmd + ": " + e.what());
  }

  ios.run_for(timeout);
  if (!ios.stopped()) {
    LOG_WARN << cmd << unfold(args) << ": timed out after "
             << timeout.count() << " ms";
    std::error_code ec;
    child.terminate(ec);
    child.wait(ec);
    throw ProcessError(cmd + " timed out after " +
                       std::to_string(timeout.count()) + " ms");
  }

  child.wait();

  ProcessResult result;
  result.exit_code = child.exit_code();
  result.out = out.get();
  result.err = err.get();

  LOG_TRACE << cmd << unfold(args) << ": returned exit code "
            << result.exit_code;
  return result;
}
