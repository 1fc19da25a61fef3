#ifndef WATCH_SESSION_HPP
#define WATCH_SESSION_HPP

#include "core/site_builder.hpp"
#include "utils/rebuild_loop.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

namespace fs = std::filesystem;

// Watches a site and rebuilds it on change until stopped.
class WatchSession {
public:
  WatchSession(fs::path root, BuildOptions options,
               std::chrono::milliseconds debounce = RebuildLoop::default_debounce);

  // Blocks until stop(). Does not build before the first change.
  void run();

  // Thread safe. Waits for a rebuild in progress.
  void stop();

  const RebuildLoop &loop() const { return rebuild_loop; }

  // True between watch setup in run() and its return.
  bool is_watching() const { return watching; }

private:
  fs::path project_root;
  BuildOptions options;
  RebuildLoop rebuild_loop;
  std::atomic<bool> watching{false};
};

// Calls `handler` once on SIGINT or SIGTERM. The returned guard stops
// listening when destroyed.
class ShutdownSignal {
public:
  explicit ShutdownSignal(std::function<void(int)> handler);
  ~ShutdownSignal();

  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};

// `quire build --watch`: build once, then rebuild on change until a signal
// arrives. Returns the exit code of the initial build.
int run_watch(const fs::path &root, const BuildOptions &options,
              std::chrono::milliseconds debounce);

#endif
