#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>

enum class LoopState { Idle, Debouncing, Building, Stopped };

const char *to_string(LoopState state);
std::ostream &operator<<(std::ostream &out, LoopState state);

// Coalesces bursts of change notifications into single rebuilds.
//
//   Idle --notify--> Debouncing --quiet for `debounce`--> Building --> Idle
//
// A notification during Debouncing restarts the window. Notifications during
// Building schedule exactly one more rebuild once the current one is done.
// Builds run on the thread that called run(), one at a time.
class RebuildLoop {
public:
  using BuildFn = std::function<void()>;

  static constexpr std::chrono::milliseconds default_debounce{300};

  explicit RebuildLoop(BuildFn build,
                       std::chrono::milliseconds debounce = default_debounce);

  RebuildLoop(const RebuildLoop &) = delete;
  RebuildLoop &operator=(const RebuildLoop &) = delete;

  // Thread safe. Ignored once stop() was called.
  void notify(const std::string &path);

  // Blocks until stop().
  void run();

  // Stop accepting events and wait for an in-flight build to finish.
  void stop();

  LoopState state() const;
  int rebuild_count() const;

  // Wait until at least `count` rebuilds completed and the loop is idle.
  bool wait_for_rebuilds(int count, std::chrono::milliseconds timeout) const;

private:
  using Clock = std::chrono::steady_clock;

  BuildFn build;
  const std::chrono::milliseconds debounce;

  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  LoopState current = LoopState::Idle;
  Clock::time_point deadline;
  bool pending = false;
  bool stopping = false;
  bool running = false;
  int rebuilds = 0;

  void run_build(std::unique_lock<std::mutex> &lock);
};
