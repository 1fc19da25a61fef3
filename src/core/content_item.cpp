#include "content_item.hpp"
#include "errors.hpp"

#include <iterator>

const char *to_string(ContentKind kind) {
  return kind == ContentKind::Post ? "post" : "page";
}

std::ostream &operator<<(std::ostream &out, ContentKind kind) {
  return out << to_string(kind);
}

ContentItem ContentItem::create(const fs::path &source_path,
                                FrontMatter metadata, std::string body) {
  if (source_path.empty()) {
    throw LoadError("", "content item without a source path");
  }

  ContentItem item;
  item.source_path = source_path.lexically_normal();
  item.metadata = std::move(metadata);
  item.body = std::move(body);
  item.kind = derive_kind(item.source_path, item.metadata);
  item.output_path = derive_output_path(item.source_path, item.metadata);
  item.url = derive_url(item.output_path);
  return item;
}

std::string ContentItem::title() const {
  return metadata.get("title", source_path.stem().string());
}

std::string ContentItem::date() const { return metadata.get("date"); }

std::vector<std::string> ContentItem::tags() const {
  return metadata.get_list("tags");
}

bool ContentItem::is_draft() const { return metadata.get_bool("draft"); }

ContentKind ContentItem::derive_kind(const fs::path &source_path,
                                     const FrontMatter &metadata) {
  const std::string explicit_kind = metadata.get("kind");
  if (explicit_kind == "post") {
    return ContentKind::Post;
  }
  if (explicit_kind == "page") {
    return ContentKind::Page;
  }

  auto first = source_path.begin();
  if (first != source_path.end() && std::next(first) != source_path.end() &&
      first->string() == "posts") {
    return ContentKind::Post;
  }
  return ContentKind::Page;
}

fs::path ContentItem::derive_output_path(const fs::path &source_path,
                                         const FrontMatter &metadata) {
  std::string permalink = metadata.get("permalink");
  if (!permalink.empty()) {
    while (!permalink.empty() && permalink.front() == '/') {
      permalink.erase(0, 1);
    }

    fs::path target = fs::path(permalink).lexically_normal();
    if (!target.empty() && target.begin()->string() == "..") {
      throw LoadError(source_path.generic_string(),
                      "permalink escapes the output directory: " + permalink);
    }
    if (target.empty() || permalink.back() == '/' || target == ".") {
      return (target / "index.html").lexically_normal();
    }
    if (target.has_extension()) {
      return target;
    }
    return target / "index.html";
  }

  fs::path stem_dir = source_path.parent_path();
  if (source_path.stem() == "index") {
    return stem_dir / "index.html";
  }
  return stem_dir / source_path.stem() / "index.html";
}

std::string ContentItem::derive_url(const fs::path &output_path) {
  std::string path = output_path.generic_string();
  static const std::string index = "index.html";

  if (path == index) {
    return "/";
  }
  if (path.size() > index.size() &&
      path.compare(path.size() - index.size(), index.size(), index) == 0 &&
      path[path.size() - index.size() - 1] == '/') {
    return "/" + path.substr(0, path.size() - index.size());
  }
  return "/" + path;
}

nlohmann::json ContentItem::to_json(const std::string &base_url) const {
  nlohmann::json page = metadata.data.is_object() ? metadata.data
                                                  : nlohmann::json::object();

  page["title"] = title();
  page["url"] = url;
  page["absolute_url"] = base_url + url;
  page["content"] = rendered_html;
  page["kind"] = to_string(kind);
  page["source_path"] = source_path.generic_string();
  page["layout"] = layout.empty() ? metadata.get("layout") : layout;
  if (!page.contains("date")) {
    page["date"] = "";
  }
  if (!page.contains("tags")) {
    page["tags"] = nlohmann::json::array();
  }

  return page;
}
