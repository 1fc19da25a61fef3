#ifndef SITE_BUILDER_HPP
#define SITE_BUILDER_HPP

#include "build_result.hpp"
#include "content_item.hpp"
#include "markdown.hpp"
#include "output_formats.hpp"
#include "renderer.hpp"
#include "template_resolver.hpp"
#include "utils/config.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct BuildOptions {
  bool include_drafts = false;
  // Worker threads. 0 takes `concurrency` from the config, then the number
  // of hardware threads.
  unsigned concurrency = 0;
  // Overrides `output_formats` from the config when not empty.
  std::vector<std::string> formats;
  // No progress output on stdout.
  bool quiet = false;
};

// One file to be written, relative to the output directory.
struct OutputFile {
  fs::path path;
  std::string data;
};

// Runs one complete build of a site. An instance is used for a single build;
// the watch loop constructs a new one per rebuild.
class SiteBuilder {
public:
  explicit SiteBuilder(fs::path root, BuildOptions options = {});

  // Never throws for content problems; everything is reported in the result.
  BuildResult build();

  // Group posts into pages of `per_page` (at least one page, possibly
  // empty).
  static std::vector<std::vector<size_t>> paginate(size_t count, int per_page);

  // Posts newest first, ties broken by source path.
  static void sort_posts(std::vector<const ContentItem *> &posts);

  // `output_dir` resolved against `root`. Throws ConfigError when it is not
  // a strict subdirectory of the root, or when it overlaps the content,
  // templates or static directory.
  static fs::path guarded_output_dir(const fs::path &root,
                                     const SiteConfig &config);

private:
  struct ListingPage {
    fs::path output_path;
    std::string template_id;
    nlohmann::json page;
    nlohmann::json paginator;
  };

  struct RenderOutput {
    std::vector<OutputFile> files;
    std::vector<BuildError> errors;
    bool rendered = false;
  };

  fs::path project_root;
  BuildOptions options;
  SiteConfig config;
  fs::path output_dir;
  std::string build_id;

  std::unique_ptr<MarkupConverter> converter;
  std::unique_ptr<FormatWriter> writer;
  std::unique_ptr<TemplateResolver> resolver;
  std::unique_ptr<Renderer> renderer;

  std::vector<ContentItem> items;
  std::vector<const ContentItem *> posts;
  // Everything that is not a post, in source path order.
  std::vector<const ContentItem *> pages;
  std::map<std::string, std::vector<const ContentItem *>> tags;
  nlohmann::json site_json;
  nlohmann::json content_json;

  unsigned thread_count() const;
  std::vector<std::string> formats() const;

  void drop_duplicate_outputs(BuildResult &result);
  void convert_all(BuildResult &result);
  void resolve_layouts(BuildResult &result);
  void build_aggregates();
  std::vector<ListingPage> listing_pages() const;

  RenderOutput render_item(const ContentItem &item) const;
  RenderOutput render_listing(const ListingPage &listing) const;
  RenderContext make_context(nlohmann::json page) const;

  void write_file(const fs::path &relative, const std::string &data) const;
  int copy_static_files() const;

  void log_processed(const std::string &label, bool ok,
                     const std::string &note = "") const;
};

// Convenience wrapper used by the CLI and the watch loop.
BuildResult build_site(const fs::path &root, const BuildOptions &options = {});

#endif
