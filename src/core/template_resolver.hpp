#ifndef TEMPLATE_RESOLVER_HPP
#define TEMPLATE_RESOLVER_HPP

#include "content_item.hpp"
#include <filesystem>
#include <set>
#include <string>

namespace fs = std::filesystem;

// Picks the template for a content item. The templates directory is listed
// once at construction and the listing is reused for the whole build.
class TemplateResolver {
public:
  TemplateResolver(const fs::path &templates_dir,
                   std::string default_layout = "default");

  // Template id for `item`: explicit `layout`, then the kind default, then
  // the site default. Throws TemplateNotFoundError.
  std::string resolve(const ContentItem &item) const;

  bool has(const std::string &name) const;

  // Template file name handed to the engine ("post" -> "post.html").
  static std::string file_name(const std::string &id);

  static const char *kind_default(ContentKind kind);

  const std::set<std::string> &templates() const { return available; }

private:
  std::set<std::string> available;
  std::string default_layout;
};

#endif
