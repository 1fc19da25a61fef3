#include "template_resolver.hpp"
#include "errors.hpp"
#include "utils/logging.hpp"

#include <system_error>

namespace {

std::string strip_html_extension(std::string name) {
  static const std::string ext = ".html";
  if (name.size() > ext.size() &&
      name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
    name.resize(name.size() - ext.size());
  }
  return name;
}

} // namespace

TemplateResolver::TemplateResolver(const fs::path &templates_dir,
                                   std::string default_layout)
    : default_layout(std::move(default_layout)) {
  if (!fs::is_directory(templates_dir)) {
    LOG_WARN << "Templates directory not found: " << templates_dir;
    return;
  }

  std::error_code ec;
  for (fs::recursive_directory_iterator it(templates_dir, ec), end;
       !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file() || it->path().extension() != ".html") {
      continue;
    }
    const fs::path relative = fs::relative(it->path(), templates_dir);
    available.insert(strip_html_extension(relative.generic_string()));
  }
  if (ec) {
    LOG_WARN << "Error listing templates in " << templates_dir << ": "
             << ec.message();
  }

  LOG_DEBUG << "Found " << available.size() << " templates in "
            << templates_dir;
}

const char *TemplateResolver::kind_default(ContentKind kind) {
  return kind == ContentKind::Post ? "post" : "default";
}

std::string TemplateResolver::file_name(const std::string &id) {
  return id + ".html";
}

bool TemplateResolver::has(const std::string &name) const {
  return available.count(strip_html_extension(name)) > 0;
}

std::string TemplateResolver::resolve(const ContentItem &item) const {
  const std::string item_path = item.source_path.generic_string();

  const std::string layout = item.metadata.get("layout");
  if (!layout.empty()) {
    const std::string id = strip_html_extension(layout);
    if (!has(id)) {
      throw TemplateNotFoundError(id, item_path);
    }
    return id;
  }

  const std::string preferred = kind_default(item.kind);
  if (has(preferred)) {
    return preferred;
  }
  if (!default_layout.empty() && has(default_layout)) {
    return strip_html_extension(default_layout);
  }

  throw TemplateNotFoundError(preferred, item_path);
}
