#ifndef TEMPLATE_ENGINE_HPP
#define TEMPLATE_ENGINE_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <inja/inja.hpp>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// Thin wrapper around one inja environment rooted at the templates directory.
// Instances are cheap and are not shared between threads.
class TemplateEngine {
public:
  using json = nlohmann::json;

  explicit TemplateEngine(const fs::path &templates_dir)
      : env(with_trailing_separator(templates_dir)) {
    env.set_throw_at_missing_includes(true);
    env.set_trim_blocks(true);
    env.set_lstrip_blocks(true);
    setup_custom_filters();
  }

  // Render `<templates_dir>/<name>`. Inheritance ({% extends %}) and
  // includes resolve relative to the templates directory.
  std::string render_file(const std::string &name, const json &data) {
    return env.render_file(name, data);
  }

  std::string render(const std::string &template_content, const json &data) {
    return env.render(template_content, data);
  }

  static json yaml_to_json(const YAML::Node &node) {
    if (!node || node.IsNull()) {
      return nullptr;
    }

    if (node.IsScalar()) {
      // Quoted scalars carry the non-specific tag "!" and stay strings.
      if (node.Tag() == "!") {
        return node.Scalar();
      }

      long long integer = 0;
      if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
      }
      double number = 0;
      if (YAML::convert<double>::decode(node, number)) {
        return number;
      }
      bool flag = false;
      if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
      }
      return node.Scalar();
    }

    if (node.IsSequence()) {
      json result = json::array();
      for (const auto &item : node) {
        result.push_back(yaml_to_json(item));
      }
      return result;
    }

    if (node.IsMap()) {
      json result = json::object();
      for (auto it = node.begin(); it != node.end(); ++it) {
        result[it->first.as<std::string>()] = yaml_to_json(it->second);
      }
      return result;
    }

    return nullptr;
  }

  static std::tm parse_date(const std::string &date_str) {
    std::tm tm = {};
    std::istringstream ss(date_str);

    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (!ss.fail())
      return tm;

    ss.clear();
    ss.str(date_str);
    ss >> std::get_time(&tm, "%Y/%m/%d");
    if (!ss.fail())
      return tm;

    return {};
  }

  static std::string slugify(const std::string &text) {
    std::string slug;
    bool dash = false;
    for (unsigned char c : text) {
      if (std::isalnum(c)) {
        slug += static_cast<char>(std::tolower(c));
        dash = false;
      } else if (!slug.empty() && !dash) {
        slug += '-';
        dash = true;
      }
    }
    if (!slug.empty() && slug.back() == '-') {
      slug.pop_back();
    }
    return slug;
  }

private:
  inja::Environment env;

  static std::string with_trailing_separator(const fs::path &dir) {
    std::string path = dir.string();
    if (!path.empty() && path.back() != '/') {
      path += '/';
    }
    return path;
  }

  void setup_custom_filters() {

    env.add_callback("date", 2, [](inja::Arguments &args) {
      std::string date_str = args.at(0)->get<std::string>();
      std::string format = args.at(1)->get<std::string>();

      std::tm tm = parse_date(date_str);
      if (tm.tm_year == 0) {
        return date_str;
      }

      static const char *month_names[] = {"January", "February", "March",
                                          "April",   "May",      "June",
                                          "July",    "August",   "September",
                                          "October", "November", "December"};

      if (format == "long") {
        format = "%B %d, %Y";
      } else if (format == "iso") {
        format = "%Y-%m-%d";
      }

      // %B is expanded by hand so the output does not depend on the locale.
      std::string result;
      for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size() && format[i + 1] == 'B') {
          result += month_names[tm.tm_mon];
          ++i;
          continue;
        }
        result += format[i];
      }

      std::ostringstream out;
      out << std::put_time(&tm, result.c_str());
      return out.str();
    });

    env.add_callback("truncate", 2, [](inja::Arguments &args) {
      std::string str = args.at(0)->get<std::string>();
      int len = args.at(1)->get<int>();
      if (len >= 0 && str.length() > static_cast<size_t>(len)) {
        return str.substr(0, len) + "...";
      }
      return str;
    });

    env.add_callback("limit", 2, [](inja::Arguments &args) {
      const auto &arr = *args.at(0);
      int count = args.at(1)->get<int>();

      json result = json::array();
      if (!arr.is_array()) {
        return result;
      }

      int size = static_cast<int>(arr.size());
      int limit = std::clamp(count, 0, size);
      for (int i = 0; i < limit; ++i) {
        result.push_back(arr[i]);
      }
      return result;
    });

    env.add_callback("slugify", 1, [](inja::Arguments &args) {
      return slugify(args.at(0)->get<std::string>());
    });
  }
};

#endif
