#include "watch_session.hpp"
#include "utils/config.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/logging.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include <thread>

WatchSession::WatchSession(fs::path root, BuildOptions options,
                           std::chrono::milliseconds debounce)
    : project_root(std::move(root)), options(std::move(options)),
      rebuild_loop(
          [this] {
            std::cout << termcolor::bright_cyan << "  🔨 Rebuilding site..."
                      << termcolor::reset << "\n";
            BuildResult result = build_site(project_root, this->options);
            LOG_INFO << "Rebuild " << (result.success ? "succeeded" : "failed")
                     << " in " << result.duration.count() << " ms";
          },
          debounce) {}

void WatchSession::run() {
  // Directories are taken from the config at startup. A broken config still
  // gets watched so that fixing it triggers a rebuild.
  SiteConfig config;
  fs::path output_dir = project_root / config.output_dir;
  try {
    config = SiteConfig::load(project_root);
    output_dir = SiteBuilder::guarded_output_dir(project_root, config);
  } catch (const ConfigError &e) {
    LOG_WARN << "Watching with default directories: " << e.what();
  }

  const fs::path root = fs::absolute(project_root);

  // The watcher is destroyed first; its thread calls into the listener.
  SiteWatchListener listener(root, fs::absolute(output_dir), &rebuild_loop);
  efsw::FileWatcher watcher;

  std::cout << "\n"
            << termcolor::bright_cyan << "👁️  Setting up file watchers"
            << termcolor::reset << "\n";

  int watch_count = add_site_watches(
      watcher, listener, root, root / config.content_dir,
      root / config.templates_dir, root / config.static_dir);
  watcher.watch();
  watching = true;

  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Watching " << termcolor::bright_white << watch_count
            << termcolor::reset << " locations. Press Ctrl+C to stop.\n\n";

  rebuild_loop.run();
  watching = false;
}

void WatchSession::stop() { rebuild_loop.stop(); }

struct ShutdownSignal::Impl {
  boost::asio::io_context io;
  boost::asio::signal_set signals{io, SIGINT, SIGTERM};
  std::thread thread;
};

ShutdownSignal::ShutdownSignal(std::function<void(int)> handler)
    : impl(std::make_unique<Impl>()) {
  impl->signals.async_wait(
      [handler = std::move(handler)](const boost::system::error_code &ec,
                                     int signal_number) {
        if (!ec) {
          LOG_INFO << "Received signal " << signal_number << ", shutting down";
          handler(signal_number);
        }
      });
  impl->thread = std::thread([this] { impl->io.run(); });
}

ShutdownSignal::~ShutdownSignal() {
  impl->io.stop();
  if (impl->thread.joinable()) {
    impl->thread.join();
  }
}

int run_watch(const fs::path &root, const BuildOptions &options,
              std::chrono::milliseconds debounce) {
  BuildResult first = build_site(root, options);

  WatchSession session(root, options, debounce);
  {
    ShutdownSignal on_signal([&session](int) {
      std::cout << "\n"
                << termcolor::bright_yellow << "⏳ Shutting down..."
                << termcolor::reset << "\n";
      session.stop();
    });
    session.run();
  }

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Watcher stopped after " << session.loop().rebuild_count()
            << " rebuilds\n\n";
  return first.exit_code();
}
