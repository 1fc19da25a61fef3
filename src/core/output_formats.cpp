#include "output_formats.hpp"
#include "content_loader.hpp"
#include "errors.hpp"
#include "utils/logging.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {

const std::string content_rule(80, '=');

std::string value_string(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_array()) {
    std::string joined;
    for (const auto &element : value) {
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += value_string(element);
    }
    return joined;
  }
  return value.dump();
}

// "css_config" -> "Css_Config"
std::string title_case(const std::string &key) {
  std::string out;
  bool word_start = true;
  for (char c : key) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      out += static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
      word_start = false;
    } else {
      out += c;
      word_start = true;
    }
  }
  return out;
}

// Front matter keys may hold characters XML names cannot.
std::string xml_tag(const std::string &key) {
  std::string tag;
  for (char c : key) {
    const auto uc = static_cast<unsigned char>(c);
    tag += (std::isalnum(uc) || c == '_' || c == '-' || c == '.') && uc < 0x80
               ? c
               : '_';
  }
  if (tag.empty() || !(std::isalpha(static_cast<unsigned char>(tag[0])) ||
                       tag[0] == '_')) {
    tag.insert(tag.begin(), '_');
  }
  return tag;
}

void write_file(const fs::path &path, const std::string &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw WriteError(path.string(), "cannot open file for writing");
  }
  out << data;
  out.close();
  if (!out) {
    throw WriteError(path.string(), "write failed");
  }
}

} // namespace

FormatWriter::FormatWriter(const MarkupConverter &converter,
                           std::string from_format)
    : converter(converter), from_format(std::move(from_format)) {}

std::string FormatWriter::extension(const std::string &format) {
  if (format == "plain" || format == "txt") {
    return "txt";
  }
  if (format == "markdown" || format == "gfm" || format == "commonmark") {
    return "md";
  }
  return format;
}

nlohmann::json FormatWriter::document_metadata(const ContentItem &item) {
  nlohmann::json merged = item.metadata.data.is_object()
                              ? item.metadata.data
                              : nlohmann::json::object();
  merged["title"] = item.title();
  const std::string layout =
      item.layout.empty() ? item.metadata.get("layout") : item.layout;
  if (!layout.empty()) {
    merged["layout"] = layout;
  }

  nlohmann::json metadata = nlohmann::json::object();
  for (auto it = merged.begin(); it != merged.end(); ++it) {
    if (!it.value().is_null()) {
      metadata[it.key()] = it.value();
    }
  }
  return metadata;
}

std::string FormatWriter::plain_document(const nlohmann::json &metadata,
                                         const DocumentOutline &outline) {
  std::ostringstream out;
  out << "METADATA:\n";
  for (auto it = metadata.begin(); it != metadata.end(); ++it) {
    out << title_case(it.key()) << ": " << value_string(it.value()) << "\n";
  }
  out << "\nCONTENT:\n" << content_rule << "\n\n" << outline.to_plain();
  return out.str();
}

std::string FormatWriter::xml_document(const nlohmann::json &metadata,
                                       const DocumentOutline &outline) {
  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<document>\n"
      << "  <meta>\n";
  for (auto it = metadata.begin(); it != metadata.end(); ++it) {
    const std::string tag = xml_tag(it.key());
    out << "    <" << tag << ">" << escape_xml(value_string(it.value()))
        << "</" << tag << ">\n";
  }
  out << "  </meta>\n"
      << "  <content>\n"
      << outline.to_xml(4) << "  </content>\n"
      << "</document>\n";
  return out.str();
}

nlohmann::json FormatWriter::json_document(const nlohmann::json &metadata,
                                           const DocumentOutline &outline) {
  return {{"metadata", metadata}, {"content", outline.to_json()}};
}

DocumentOutline FormatWriter::outline(const ContentItem &item) const {
  if (Md4cConverter::accepts(from_format)) {
    return DocumentOutline::parse(item.body);
  }
  return DocumentOutline::parse(
      converter.convert(item.body, from_format, "commonmark"));
}

std::string FormatWriter::write(const ContentItem &item,
                                const std::string &format) const {
  if (format == "html") {
    return item.rendered_html;
  }
  if (format == "plain" || format == "txt") {
    return plain_document(document_metadata(item), outline(item));
  }
  if (format == "xml") {
    return xml_document(document_metadata(item), outline(item));
  }
  if (format == "json") {
    return json_document(document_metadata(item), outline(item)).dump(2) +
           "\n";
  }
  return converter.convert(item.body, from_format, format);
}

ConvertResult convert_file(const fs::path &input,
                           const std::vector<std::string> &formats,
                           const fs::path &output_dir,
                           const SiteConfig &config) {
  ContentItem item = ContentLoader::load_file(input, input.filename());

  auto converter = MarkupConverter::create(config.converter);
  const std::string &from = config.converter.from_format;
  try {
    item.rendered_html = converter->convert(item.body, from, "html");
  } catch (const ConversionError &e) {
    throw ConversionError(input.string(), e.reason());
  }
  FormatWriter writer(*converter, from);

  fs::path base = input;
  base.replace_extension();
  if (!output_dir.empty()) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
      throw WriteError(output_dir.string(), ec.message());
    }
    base = output_dir / input.stem();
  }

  std::error_code ec;
  const fs::path source = fs::weakly_canonical(input, ec);

  ConvertResult result;
  for (const auto &format : formats) {
    fs::path target = base;
    target += "." + FormatWriter::extension(format);

    try {
      std::error_code target_ec;
      if (!ec && fs::weakly_canonical(target, target_ec) == source) {
        throw WriteError(target.string(), "would overwrite the input file");
      }
      write_file(target, writer.write(item, format));
      LOG_DEBUG << "Converted " << input << " to " << target;
      result.written.push_back(target);
    } catch (const ConversionError &e) {
      result.errors.push_back(
          {ErrorKind::Conversion, target.string(), format + ": " + e.reason()});
    } catch (const WriteError &e) {
      result.errors.push_back(BuildError::from(e));
    }
  }
  return result;
}
