#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

struct ConverterConfig {
  // "md4c" (in-process) or "pandoc" (external executable)
  std::string engine = "md4c";
  std::string command = "pandoc";
  std::string from_format = "markdown";
  std::chrono::seconds timeout{30};
  std::vector<std::string> args;
};

class SiteConfig {
public:
  static constexpr const char *default_file_name = "config.yaml";

  std::string title = "My Site";
  std::string url;
  std::string description;
  std::string author;

  std::string output_dir = "_site";
  std::string content_dir = "content";
  std::string templates_dir = "templates";
  std::string static_dir = "static";

  std::string default_layout = "default";
  int paginate = 10;
  std::vector<std::string> output_formats{"html"};
  unsigned concurrency = 0;

  ConverterConfig converter;

  // The whole document, including keys this class does not know about.
  YAML::Node custom_yaml_data;

  // The config file that was loaded, empty when the site has none.
  fs::path source;

  // Load <root>/config.yaml (or config.yml). A site without a config file
  // gets the defaults. Throws ConfigError on malformed input.
  static SiteConfig load(const fs::path &project_root);

  static SiteConfig parse(const std::string &yaml_text,
                          const std::string &origin = default_file_name);

  // Existing config file under the root, or an empty path.
  static fs::path locate(const fs::path &project_root);

  // The `site` object handed to templates. Unknown keys pass through as-is,
  // recognised keys carry their effective (defaulted) values.
  nlohmann::json to_json() const;

  // Base URL without a trailing slash.
  std::string base_url() const;
};

#endif
