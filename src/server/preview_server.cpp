#include "preview_server.hpp"
#include "server.hpp"
#include "utils/config.hpp"
#include "watch_session.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <termcolor/termcolor.hpp>
#include <thread>

static std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

static void log_request(const Request &req, const Response &res) {
  std::cout << termcolor::bright_blue << "[" << get_timestamp() << "]"
            << termcolor::reset << " " << termcolor::bright_cyan << req.method
            << termcolor::reset << " " << termcolor::white << req.path
            << termcolor::reset << " ";

  if (res.status >= 200 && res.status < 300) {
    std::cout << termcolor::bright_green;
  } else if (res.status >= 300 && res.status < 400) {
    std::cout << termcolor::bright_yellow;
  } else if (res.status >= 400 && res.status < 500) {
    std::cout << termcolor::bright_red;
  } else {
    std::cout << termcolor::red << termcolor::bold;
  }
  std::cout << res.status << termcolor::reset << std::endl;
}

static std::string format_size(size_t bytes) {
  const char *units[] = {"B", "KB", "MB", "GB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024 && unit < 3) {
    size /= 1024;
    unit++;
  }

  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << size << " " << units[unit];
  return ss.str();
}

int start_preview_server(const fs::path &project_root,
                         const ServeOptions &options) {
  fs::path output_dir;
  try {
    SiteConfig config = SiteConfig::load(project_root);
    output_dir = SiteBuilder::guarded_output_dir(project_root, config);
  } catch (const ConfigError &e) {
    std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
              << e.what() << "\n";
    return 1;
  }

  if (!fs::is_directory(output_dir)) {
    std::cout << termcolor::yellow << "  → " << termcolor::reset
              << "No build output at " << output_dir << ", building first\n";
    BuildResult result = build_site(project_root, options.build);
    if (!result.success) {
      return result.exit_code();
    }
  }

  size_t total_size = 0;
  size_t file_count = 0;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(output_dir, ec), end;
       !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file()) {
      total_size += it->file_size();
      file_count++;
    }
  }

  Server svr(output_dir);
  svr.set_logger(log_request);

  std::unique_ptr<WatchSession> session;
  std::thread watch_thread;
  if (options.watch) {
    session = std::make_unique<WatchSession>(project_root, options.build,
                                             options.debounce);
    watch_thread = std::thread([&session] { session->run(); });
  }

  ShutdownSignal on_signal([&svr, &session](int) {
    std::cout << termcolor::yellow << "\n⏳ Shutting down..."
              << termcolor::reset << "\n";
    if (session) {
      session->stop();
    }
    svr.stop();
  });

  const std::string address =
      "http://" + options.host + ":" + std::to_string(options.port);

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔════════════════════════════════════════╗\n"
            << "║          Preview Server                ║\n"
            << "╚════════════════════════════════════════╝" << termcolor::reset
            << "\n\n";

  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Ready to serve\n";
  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Directory: " << termcolor::white << output_dir
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Files: " << termcolor::white << file_count << termcolor::reset
            << " (" << format_size(total_size) << ")\n";
  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Local: " << termcolor::bright_cyan << address
            << termcolor::reset << "\n\n";
  std::cout << termcolor::bright_blue
            << "───────────────────────────────────────────\n"
            << termcolor::reset;

  const bool served = svr.listen(options.host, options.port);

  if (session) {
    session->stop();
  }
  if (watch_thread.joinable()) {
    watch_thread.join();
  }

  if (!served) {
    std::cerr << termcolor::bright_red << "✗ Failed to start HTTP server"
              << termcolor::reset << "\n";
    return 1;
  }

  std::cout << termcolor::bright_green << "✓ Server stopped cleanly"
            << termcolor::reset << "\n\n";
  return 0;
}
