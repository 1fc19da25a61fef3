#pragma once

#include <efsw/efsw.hpp>
#include <filesystem>
#include <string>

class RebuildLoop;

// Forwards filesystem events under the site root to a RebuildLoop.
class SiteWatchListener : public efsw::FileWatchListener {
private:
  std::filesystem::path project_root;
  std::filesystem::path output_dir;
  RebuildLoop *loop;

public:
  SiteWatchListener(const std::filesystem::path &root,
                    const std::filesystem::path &output_dir, RebuildLoop *loop);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

  // False for hidden files, editor temporaries and anything inside the
  // output directory.
  static bool is_relevant(const std::filesystem::path &path,
                          const std::filesystem::path &output_dir);

  static const char *action_name(efsw::Action action);
};

// Registers the content, templates and static directories (recursively) and
// the site root (for the config file) with `watcher`. Returns the number of
// watches added.
int add_site_watches(efsw::FileWatcher &watcher, SiteWatchListener &listener,
                     const std::filesystem::path &root,
                     const std::filesystem::path &content_dir,
                     const std::filesystem::path &templates_dir,
                     const std::filesystem::path &static_dir);
