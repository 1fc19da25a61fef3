#ifndef CONTENT_ITEM_HPP
#define CONTENT_ITEM_HPP

#include "frontmatter.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <ostream>
#include <vector>
#include <string>

namespace fs = std::filesystem;

enum class ContentKind { Post, Page };

const char *to_string(ContentKind kind);
std::ostream &operator<<(std::ostream &out, ContentKind kind);

// One source file of the site. Created fresh by the loader on every build,
// filled in by the conversion and render phases, then discarded.
struct ContentItem {
  // Relative to the content root, generic ('/') separators.
  fs::path source_path;
  FrontMatter metadata;
  std::string body;

  // Empty until the conversion phase ran for this item.
  std::string rendered_html;

  // Relative to the output directory.
  fs::path output_path;
  // Root-relative public path, e.g. "/posts/hello/".
  std::string url;
  ContentKind kind = ContentKind::Page;
  // Template id picked by the resolver.
  std::string layout;

  static ContentItem create(const fs::path &source_path, FrontMatter metadata,
                            std::string body);

  std::string title() const;
  std::string date() const;
  std::vector<std::string> tags() const;
  bool is_draft() const;

  // The `page` object templates see: every metadata key plus the derived
  // fields.
  nlohmann::json to_json(const std::string &base_url = "") const;

  static ContentKind derive_kind(const fs::path &source_path,
                                 const FrontMatter &metadata);
  static fs::path derive_output_path(const fs::path &source_path,
                                     const FrontMatter &metadata);
  static std::string derive_url(const fs::path &output_path);
};

#endif
