#include "frontmatter.hpp"
#include "errors.hpp"
#include "template_engine.hpp"
#include "yaml-cpp/yaml.h"

namespace {

bool is_delimiter(const std::string &content, size_t begin, size_t end,
                  const char *marker) {
  std::string line = content.substr(begin, end - begin);
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                           line.back() == '\t')) {
    line.pop_back();
  }
  return line == marker;
}

size_t line_end(const std::string &content, size_t pos) {
  size_t end = content.find('\n', pos);
  return end == std::string::npos ? content.size() : end;
}

std::string scalar_to_string(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return {};
  }
  return value.dump();
}

} // namespace

std::pair<FrontMatter, std::string>
FrontMatter::parse(const std::string &content) {
  FrontMatter fm;

  size_t start = 0;
  if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    start = 3;
  }

  size_t first_end = line_end(content, start);
  if (!is_delimiter(content, start, first_end, "---")) {
    return {fm, content.substr(start)};
  }

  size_t yaml_begin = first_end < content.size() ? first_end + 1 : first_end;
  size_t pos = yaml_begin;
  size_t close_begin = std::string::npos;
  size_t close_end = std::string::npos;

  while (pos < content.size()) {
    size_t end = line_end(content, pos);
    if (is_delimiter(content, pos, end, "---") ||
        is_delimiter(content, pos, end, "...")) {
      close_begin = pos;
      close_end = end;
      break;
    }
    pos = end + 1;
  }

  if (close_begin == std::string::npos) {
    throw LoadError("", "metadata header is not terminated by '---'");
  }

  std::string yaml_str = content.substr(yaml_begin, close_begin - yaml_begin);
  std::string markdown =
      close_end < content.size() ? content.substr(close_end + 1) : "";

  YAML::Node node;
  try {
    node = YAML::Load(yaml_str);
  } catch (const YAML::Exception &e) {
    throw LoadError("", "YAML parsing error: " + std::string(e.what()));
  }

  if (node && !node.IsNull()) {
    if (!node.IsMap()) {
      throw LoadError("", "metadata header must be a key-value mapping");
    }
    try {
      fm.data = TemplateEngine::yaml_to_json(node);
    } catch (const YAML::Exception &e) {
      throw LoadError("", "YAML parsing error: " + std::string(e.what()));
    }
  }

  return {fm, markdown};
}

std::string FrontMatter::get(const std::string &key,
                             const std::string &default_val) const {
  auto it = data.find(key);
  return (it != data.end() && !it->is_null()) ? scalar_to_string(*it)
                                              : default_val;
}

bool FrontMatter::get_bool(const std::string &key, bool default_val) const {
  auto it = data.find(key);
  if (it == data.end()) {
    return default_val;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_string()) {
    const auto &value = it->get_ref<const std::string &>();
    return value == "true" || value == "yes";
  }
  return default_val;
}

std::vector<std::string> FrontMatter::get_list(const std::string &key) const {
  std::vector<std::string> list;
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) {
    return list;
  }

  if (it->is_array()) {
    for (const auto &item : *it) {
      list.push_back(scalar_to_string(item));
    }
  } else {
    list.push_back(scalar_to_string(*it));
  }
  return list;
}

bool FrontMatter::has(const std::string &key) const {
  return data.find(key) != data.end();
}
