#include "markdown.hpp"
#include "errors.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"

#include <md4c-html.h>
#include <md4c.h>

namespace {

void process_output(const MD_CHAR *text, MD_SIZE size, void *userdata) {
  std::string *output = static_cast<std::string *>(userdata);
  output->append(text, size);
}

std::string first_line(const std::string &text) {
  return text.substr(0, text.find('\n'));
}

} // namespace

std::unique_ptr<MarkupConverter>
MarkupConverter::create(const ConverterConfig &config) {
  if (config.engine == "pandoc") {
    return std::make_unique<PandocConverter>(config);
  }
  if (config.engine == "md4c") {
    return std::make_unique<Md4cConverter>();
  }
  throw ConfigError("converter", "unknown converter engine '" +
                                     config.engine + "'");
}

bool Md4cConverter::accepts(const std::string &from_format) {
  return from_format == "markdown" || from_format == "md" ||
         from_format == "commonmark" || from_format == "gfm";
}

std::string Md4cConverter::convert(const std::string &body,
                                   const std::string &from_format,
                                   const std::string &to_format) const {
  if (!accepts(from_format)) {
    throw ConversionError("", "md4c cannot read '" + from_format + "'");
  }
  if (to_format != "html") {
    throw ConversionError("", "md4c cannot produce '" + to_format + "'");
  }

  std::string html;
  html.reserve(body.size() + body.size() / 4);

  // GitHub flavoured markdown: tables, strikethrough, task lists, autolinks
  unsigned parser_flags = MD_DIALECT_GITHUB;
  unsigned renderer_flags = MD_HTML_FLAG_SKIP_UTF8_BOM;

  int result = md_html(body.c_str(), static_cast<MD_SIZE>(body.size()),
                       process_output, &html, parser_flags, renderer_flags);
  if (result != 0) {
    throw ConversionError("", "md4c failed to parse the document");
  }

  return html;
}

Availability Md4cConverter::check() const {
  Availability status;
  status.available = true;
  status.version = "built in";
  status.detail = "markdown -> html";
  return status;
}

std::string PandocConverter::convert(const std::string &body,
                                     const std::string &from_format,
                                     const std::string &to_format) const {
  std::vector<std::string> args{"-f", from_format, "-t", to_format};
  args.insert(args.end(), config.args.begin(), config.args.end());

  ProcessResult result;
  try {
    result = run_process(config.command, args, body,
                         std::chrono::duration_cast<std::chrono::milliseconds>(
                             config.timeout));
  } catch (const ProcessError &e) {
    throw ConversionError("", e.what());
  }

  if (result.exit_code != 0) {
    std::string message = config.command + " exited with code " +
                          std::to_string(result.exit_code);
    if (!result.err.empty()) {
      message += ": " + first_line(result.err);
    }
    throw ConversionError("", message);
  }

  return result.out;
}

Availability PandocConverter::check() const {
  Availability status;

  const std::string exe = find_executable(config.command);
  if (exe.empty()) {
    status.detail = config.command + " not found";
    return status;
  }

  try {
    auto result = run_process(config.command, {"--version"}, "",
                              std::chrono::seconds(5));
    status.available = result.exit_code == 0;
    status.version = first_line(result.out);
    status.detail = exe;
  } catch (const ProcessError &e) {
    LOG_DEBUG << "Checking " << config.command << " failed: " << e.what();
    status.detail = e.what();
  }
  return status;
}
