#include "renderer.hpp"
#include "errors.hpp"
#include "template_engine.hpp"
#include "template_resolver.hpp"
#include "utils/logging.hpp"

nlohmann::json RenderContext::to_json() const {
  nlohmann::json data;
  data["site"] = site;
  data["page"] = page;
  data["content"] = content;
  data["paginator"] = paginator ? *paginator : nlohmann::json(nullptr);
  return data;
}

std::string Renderer::render(const std::string &template_id,
                             const RenderContext &context) const {
  LOG_TRACE << "Rendering " << context.page.value("source_path", "")
            << " with template " << template_id;

  try {
    TemplateEngine engine(templates_dir);
    return engine.render_file(TemplateResolver::file_name(template_id),
                              context.to_json());
  } catch (const inja::InjaError &e) {
    std::string message = e.type + ": " + e.message;
    if (e.location.line > 0) {
      message += " (line " + std::to_string(e.location.line) + ", column " +
                 std::to_string(e.location.column) + ")";
    }
    throw RenderError(template_id, message);
  } catch (const nlohmann::json::exception &e) {
    throw RenderError(template_id, e.what());
  }
}
