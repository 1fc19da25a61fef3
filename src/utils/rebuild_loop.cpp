#include "rebuild_loop.hpp"
#include "logging.hpp"

const char *to_string(LoopState state) {
  switch (state) {
  case LoopState::Idle:
    return "idle";
  case LoopState::Debouncing:
    return "debouncing";
  case LoopState::Building:
    return "building";
  case LoopState::Stopped:
    return "stopped";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &out, LoopState state) {
  return out << to_string(state);
}

RebuildLoop::RebuildLoop(BuildFn build, std::chrono::milliseconds debounce)
    : build(std::move(build)), debounce(debounce) {}

void RebuildLoop::notify(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex);
  if (stopping || current == LoopState::Stopped) {
    return;
  }

  LOG_DEBUG << "Change detected: " << path << " (" << current << ")";

  if (current == LoopState::Building) {
    pending = true;
    return;
  }

  current = LoopState::Debouncing;
  deadline = Clock::now() + debounce;
  cv.notify_all();
}

void RebuildLoop::run_build(std::unique_lock<std::mutex> &lock) {
  current = LoopState::Building;
  pending = false;
  cv.notify_all();
  lock.unlock();

  try {
    build();
  } catch (const std::exception &e) {
    LOG_ERROR << "Rebuild failed: " << e.what();
  }

  lock.lock();
  ++rebuilds;
  if (pending && !stopping) {
    current = LoopState::Debouncing;
    deadline = Clock::now() + debounce;
  } else {
    current = LoopState::Idle;
  }
  pending = false;
  cv.notify_all();
}

void RebuildLoop::run() {
  std::unique_lock<std::mutex> lock(mutex);
  running = true;

  while (!stopping) {
    if (current == LoopState::Idle) {
      cv.wait(lock, [this] {
        return stopping || current == LoopState::Debouncing;
      });
      continue;
    }

    // Debouncing: a notify() moves the deadline, so re-check after waking.
    if (cv.wait_until(lock, deadline, [this] { return stopping; })) {
      break;
    }
    if (Clock::now() < deadline) {
      continue;
    }
    run_build(lock);
  }

  current = LoopState::Stopped;
  running = false;
  cv.notify_all();
}

void RebuildLoop::stop() {
  std::unique_lock<std::mutex> lock(mutex);
  stopping = true;
  cv.notify_all();
  cv.wait(lock, [this] { return !running; });
  current = LoopState::Stopped;
}

LoopState RebuildLoop::state() const {
  std::lock_guard<std::mutex> lock(mutex);
  return current;
}

int RebuildLoop::rebuild_count() const {
  std::lock_guard<std::mutex> lock(mutex);
  return rebuilds;
}

bool RebuildLoop::wait_for_rebuilds(int count,
                                    std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex);
  return cv.wait_for(lock, timeout, [this, count] {
    return rebuilds >= count && current != LoopState::Building &&
           current != LoopState::Debouncing;
  });
}
