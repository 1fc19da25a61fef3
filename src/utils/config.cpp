#include "config.hpp"
#include "core/errors.hpp"
#include "core/template_engine.hpp"
#include "utils/logging.hpp"

#include <fstream>
#include <sstream>

namespace {

template <typename T>
void assign(const YAML::Node &yaml, const char *key, T &target,
            const std::string &origin) {
  const YAML::Node node = yaml[key];
  if (!node || node.IsNull()) {
    return;
  }

  try {
    target = node.as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(origin, std::string("invalid value for '") + key +
                                  "': " + e.what());
  }
}

std::vector<std::string> as_string_list(const YAML::Node &node,
                                        const char *key,
                                        const std::string &origin) {
  std::vector<std::string> list;
  if (node.IsScalar()) {
    list.push_back(node.as<std::string>());
    return list;
  }

  if (!node.IsSequence()) {
    throw ConfigError(origin, std::string("'") + key +
                                  "' must be a string or a list of strings");
  }

  for (const auto &item : node) {
    if (!item.IsScalar()) {
      throw ConfigError(origin, std::string("'") + key +
                                    "' must only contain strings");
    }
    list.push_back(item.as<std::string>());
  }
  return list;
}

} // namespace

fs::path SiteConfig::locate(const fs::path &project_root) {
  for (const char *name : {"config.yaml", "config.yml"}) {
    fs::path candidate = project_root / name;
    if (fs::is_regular_file(candidate)) {
      return candidate;
    }
  }
  return {};
}

SiteConfig SiteConfig::load(const fs::path &project_root) {
  const fs::path config_path = locate(project_root);

  if (config_path.empty()) {
    LOG_WARN << "No " << default_file_name << " found in " << project_root
             << ". Using defaults.";
    SiteConfig config;
    config.custom_yaml_data = YAML::Node(YAML::NodeType::Map);
    return config;
  }

  std::ifstream file(config_path);
  if (!file.is_open()) {
    throw ConfigError(config_path.string(), "cannot open file");
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  LOG_DEBUG << "Loading configuration from " << config_path;
  SiteConfig config = parse(buffer.str(), config_path.string());
  config.source = config_path;
  return config;
}

SiteConfig SiteConfig::parse(const std::string &yaml_text,
                             const std::string &origin) {
  SiteConfig config;

  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception &e) {
    throw ConfigError(origin, std::string("malformed YAML: ") + e.what());
  }

  if (!yaml || yaml.IsNull()) {
    yaml = YAML::Node(YAML::NodeType::Map);
  } else if (!yaml.IsMap()) {
    throw ConfigError(origin, "the configuration must be a mapping");
  }

  config.custom_yaml_data = yaml;

  assign(yaml, "title", config.title, origin);
  assign(yaml, "url", config.url, origin);
  assign(yaml, "description", config.description, origin);
  assign(yaml, "author", config.author, origin);

  assign(yaml, "output_dir", config.output_dir, origin);
  assign(yaml, "content_dir", config.content_dir, origin);
  assign(yaml, "templates_dir", config.templates_dir, origin);
  assign(yaml, "static_dir", config.static_dir, origin);

  assign(yaml, "default_layout", config.default_layout, origin);
  assign(yaml, "paginate", config.paginate, origin);
  assign(yaml, "concurrency", config.concurrency, origin);

  if (yaml["output_formats"] && !yaml["output_formats"].IsNull()) {
    config.output_formats =
        as_string_list(yaml["output_formats"], "output_formats", origin);
  }

  if (config.output_dir.empty()) {
    throw ConfigError(origin, "'output_dir' must not be empty");
  }

  if (const YAML::Node conv = yaml["converter"]; conv && !conv.IsNull()) {
    if (conv.IsScalar()) {
      config.converter.engine = conv.as<std::string>();
    } else if (conv.IsMap()) {
      assign(conv, "engine", config.converter.engine, origin);
      assign(conv, "command", config.converter.command, origin);
      assign(conv, "from", config.converter.from_format, origin);

      int timeout = static_cast<int>(config.converter.timeout.count());
      assign(conv, "timeout", timeout, origin);
      if (timeout <= 0) {
        throw ConfigError(origin, "'converter.timeout' must be positive");
      }
      config.converter.timeout = std::chrono::seconds(timeout);

      if (conv["args"]) {
        config.converter.args =
            as_string_list(conv["args"], "converter.args", origin);
      }
    } else {
      throw ConfigError(origin, "'converter' must be a name or a mapping");
    }
  }

  if (config.converter.engine != "md4c" &&
      config.converter.engine != "pandoc") {
    throw ConfigError(origin, "unknown converter engine '" +
                                  config.converter.engine + "'");
  }

  return config;
}

nlohmann::json SiteConfig::to_json() const {
  nlohmann::json site = TemplateEngine::yaml_to_json(custom_yaml_data);
  if (!site.is_object()) {
    site = nlohmann::json::object();
  }

  site["title"] = title;
  site["url"] = base_url();
  site["description"] = description;
  site["author"] = author;
  site["output_dir"] = output_dir;
  site["paginate"] = paginate;
  site["output_formats"] = output_formats;

  return site;
}

std::string SiteConfig::base_url() const {
  std::string base = url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base;
}
