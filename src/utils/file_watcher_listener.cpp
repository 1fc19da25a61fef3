#include "file_watcher_listener.hpp"
#include "logging.hpp"
#include "rebuild_loop.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace fs = std::filesystem;

namespace {

// Lexically normal, without a trailing separator.
fs::path normalized(const fs::path &path) {
  fs::path result = path.lexically_normal();
  if (!result.has_filename() && result.has_parent_path()) {
    result = result.parent_path();
  }
  return result;
}

} // namespace

SiteWatchListener::SiteWatchListener(const fs::path &root,
                                     const fs::path &output_dir,
                                     RebuildLoop *loop)
    : project_root(normalized(root)), output_dir(normalized(output_dir)),
      loop(loop) {}

bool SiteWatchListener::is_relevant(const fs::path &path,
                                    const fs::path &output_dir) {
  const std::string name = path.filename().string();
  if (name.empty() || name[0] == '.' || name[0] == '~' || name[0] == '#' ||
      name.back() == '~') {
    return false;
  }

  const std::string ext = path.extension().string();
  if (ext == ".swp" || ext == ".swx" || ext == ".tmp" || ext == ".part") {
    return false;
  }

  if (!output_dir.empty()) {
    const fs::path relative =
        normalized(path).lexically_relative(normalized(output_dir));
    if (!relative.empty() && relative.begin()->string() != "..") {
      return false;
    }
  }

  return true;
}

const char *SiteWatchListener::action_name(efsw::Action action) {
  switch (action) {
  case efsw::Actions::Add:
    return "Added";
  case efsw::Actions::Delete:
    return "Deleted";
  case efsw::Actions::Modified:
    return "Modified";
  case efsw::Actions::Moved:
    return "Moved";
  }
  return "Changed";
}

void SiteWatchListener::handleFileAction(efsw::WatchID watchid,
                                         const std::string &dir,
                                         const std::string &filename,
                                         efsw::Action action,
                                         std::string oldFilename) {
  (void)watchid;

  const fs::path changed = normalized(fs::path(dir) / filename);
  if (!is_relevant(changed, output_dir)) {
    return;
  }

  // The root is watched non-recursively for the config file only.
  if (changed.parent_path() == project_root) {
    const std::string name = changed.filename().string();
    if (name != "config.yaml" && name != "config.yml") {
      return;
    }
  }

  const fs::path relative = changed.lexically_relative(project_root);

  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm = *std::localtime(&time);

  std::cout << termcolor::bright_blue << std::put_time(&tm, "%H:%M:%S")
            << termcolor::reset << " " << termcolor::bright_cyan
            << action_name(action) << termcolor::reset << " "
            << termcolor::bright_white << relative.generic_string()
            << termcolor::reset;
  if (action == efsw::Actions::Moved && !oldFilename.empty()) {
    std::cout << termcolor::bright_blue << " (from " << oldFilename << ")"
              << termcolor::reset;
  }
  std::cout << "\n";

  loop->notify(relative.generic_string());
}

int add_site_watches(efsw::FileWatcher &watcher, SiteWatchListener &listener,
                     const fs::path &root, const fs::path &content_dir,
                     const fs::path &templates_dir,
                     const fs::path &static_dir) {
  int added = 0;

  for (const auto &folder : {content_dir, templates_dir, static_dir}) {
    if (!fs::is_directory(folder)) {
      LOG_DEBUG << "Not watching missing directory " << folder;
      continue;
    }

    efsw::WatchID id = watcher.addWatch(folder.string(), &listener, true);
    if (id < 0) {
      LOG_WARN << "Cannot watch " << folder << ": "
               << efsw::Errors::Log::getLastErrorLog();
      continue;
    }
    ++added;
  }

  efsw::WatchID id = watcher.addWatch(root.string(), &listener, false);
  if (id < 0) {
    LOG_WARN << "Cannot watch " << root << ": "
             << efsw::Errors::Log::getLastErrorLog();
  } else {
    ++added;
  }

  return added;
}
