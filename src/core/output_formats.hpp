#ifndef OUTPUT_FORMATS_HPP
#define OUTPUT_FORMATS_HPP

#include "build_result.hpp"
#include "content_item.hpp"
#include "document_outline.hpp"
#include "markdown.hpp"
#include "utils/config.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Writes a converted item in the formats listed in `output_formats`, other
// than the templated HTML page:
//
//   html        the converted body
//   plain, txt  METADATA and CONTENT sections with the body as plain text
//   xml         <document><meta/><content/></document>
//   json        {"metadata": ..., "content": {"sections": [...]}}
//   anything    the body converted by the converter (pandoc)
class FormatWriter {
public:
  FormatWriter(const MarkupConverter &converter, std::string from_format);

  // File extension for `format`: "plain" gives "txt", the markdown
  // dialects give "md".
  static std::string extension(const std::string &format);

  // Front matter plus the title, layout and date the item ends up with.
  // Null values are left out.
  static nlohmann::json document_metadata(const ContentItem &item);

  static std::string plain_document(const nlohmann::json &metadata,
                                    const DocumentOutline &outline);
  static std::string xml_document(const nlohmann::json &metadata,
                                  const DocumentOutline &outline);
  static nlohmann::json json_document(const nlohmann::json &metadata,
                                      const DocumentOutline &outline);

  // Throws ConversionError.
  std::string write(const ContentItem &item, const std::string &format) const;

private:
  const MarkupConverter &converter;
  std::string from_format;

  // Bodies in another markup are turned into commonmark first.
  DocumentOutline outline(const ContentItem &item) const;
};

struct ConvertResult {
  std::vector<fs::path> written;
  std::vector<BuildError> errors;
};

// `quire convert`: write `input` in each of `formats` next to it, or into
// `output_dir` when given. The site config only selects the converter. Throws
// LoadError or ConversionError when the file cannot be read or converted at
// all; a failing format is recorded and the others are still written.
ConvertResult convert_file(const fs::path &input,
                           const std::vector<std::string> &formats,
                           const fs::path &output_dir,
                           const SiteConfig &config);

#endif
