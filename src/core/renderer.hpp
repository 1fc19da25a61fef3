#ifndef RENDERER_HPP
#define RENDERER_HPP

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Everything a template can see.
struct RenderContext {
  nlohmann::json site = nlohmann::json::object();
  nlohmann::json page = nlohmann::json::object();
  // All posts, newest first.
  nlohmann::json content = nlohmann::json::array();
  std::optional<nlohmann::json> paginator;

  nlohmann::json to_json() const;
};

class Renderer {
public:
  explicit Renderer(fs::path templates_dir)
      : templates_dir(std::move(templates_dir)) {}

  // Render template `template_id` with `context`. Each call builds its own
  // engine, so calls from several threads do not interfere. Throws
  // RenderError.
  std::string render(const std::string &template_id,
                     const RenderContext &context) const;

  const fs::path &directory() const { return templates_dir; }

private:
  fs::path templates_dir;
};

#endif
