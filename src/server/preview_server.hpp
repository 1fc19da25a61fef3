#ifndef PREVIEW_SERVER_HPP
#define PREVIEW_SERVER_HPP

#include "core/site_builder.hpp"
#include "utils/rebuild_loop.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

struct ServeOptions {
  std::string host = "127.0.0.1";
  int port = 8000;
  // Rebuild on change while serving.
  bool watch = false;
  std::chrono::milliseconds debounce = RebuildLoop::default_debounce;
  BuildOptions build;
};

// Serve the built site until SIGINT/SIGTERM. Builds first when the output
// directory does not exist yet. Returns the process exit code.
int start_preview_server(const fs::path &project_root,
                         const ServeOptions &options);

#endif
