#ifndef DOCUMENT_OUTLINE_HPP
#define DOCUMENT_OUTLINE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// One block of body text.
struct OutlineBlock {
  // "paragraph", "list", "code" or "quote".
  std::string type;
  std::string text;
  // Lists: "bullet" or "ordered".
  std::string style;
  // Code blocks: the fence info language, if any.
  std::string language;
  std::vector<std::string> items;
};

// A heading and the blocks up to the next heading.
struct OutlineSection {
  std::string id;
  int level = 0;
  std::string title;
  std::vector<OutlineBlock> blocks;
};

// Heading and block structure of a markdown document, as written by the
// plain, xml and json output formats. Inline markup is reduced to its text;
// tables and raw HTML blocks are left out.
class DocumentOutline {
public:
  // Blocks before the first heading.
  std::vector<OutlineBlock> preamble;
  std::vector<OutlineSection> sections;

  // Throws ConversionError when md4c rejects the input.
  static DocumentOutline parse(const std::string &markdown);

  // "Getting Started!" -> "getting-started"
  static std::string section_id(const std::string &title);

  // {"sections": [{id, level, title, content: [...]}]}, plus "preamble"
  // when there is text before the first heading.
  nlohmann::json to_json() const;

  // Content elements, each line prefixed with `indent` spaces.
  std::string to_xml(int indent) const;

  std::string to_plain() const;
};

std::string escape_xml(const std::string &text);

#endif
