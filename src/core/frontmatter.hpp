#ifndef FRONTMATTER_H
#define FRONTMATTER_H

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

// Metadata header at the top of a content file:
//
//   ---
//   title: Hello
//   tags: [a, b]
//   ---
//   body...
class FrontMatter {
public:
  nlohmann::json data = nlohmann::json::object();

  // Split `content` into header and body. Content without a header block
  // yields empty metadata and the whole text as body. Throws LoadError when a
  // header block is opened but malformed.
  static std::pair<FrontMatter, std::string> parse(const std::string &content);

  std::string get(const std::string &key,
                  const std::string &default_val = "") const;
  bool get_bool(const std::string &key, bool default_val = false) const;
  std::vector<std::string> get_list(const std::string &key) const;
  bool has(const std::string &key) const;
};

#endif
