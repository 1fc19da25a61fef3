#include "document_outline.hpp"
#include "errors.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/locale/utf.hpp>
#include <cctype>
#include <iterator>
#include <md4c.h>
#include <sstream>
#include <stdexcept>

namespace {

enum class Capture { None, Heading, Paragraph, List, Code, Quote };

// `&amp;`, `&#233;` and friends. Unknown named entities stay as written.
std::string decode_entity(const std::string &entity) {
  if (entity == "&amp;")
    return "&";
  if (entity == "&lt;")
    return "<";
  if (entity == "&gt;")
    return ">";
  if (entity == "&quot;")
    return "\"";
  if (entity == "&apos;")
    return "'";
  if (entity == "&nbsp;")
    return " ";

  if (entity.size() > 3 && entity[1] == '#') {
    const bool hex = entity[2] == 'x' || entity[2] == 'X';
    const std::string digits =
        entity.substr(hex ? 3 : 2, entity.size() - (hex ? 4 : 3));
    try {
      const auto code_point = static_cast<boost::locale::utf::code_point>(
          std::stoul(digits, nullptr, hex ? 16 : 10));
      if (boost::locale::utf::is_valid_codepoint(code_point)) {
        std::string out;
        boost::locale::utf::utf_traits<char>::encode(code_point,
                                                     std::back_inserter(out));
        return out;
      }
    } catch (const std::logic_error &) {
      // Not a number; keep the entity text.
    }
  }
  return entity;
}

struct OutlineBuilder {
  DocumentOutline outline;
  Capture capture = Capture::None;
  // Blocks open inside the captured one, the captured block included.
  int depth = 0;
  int heading_level = 0;
  OutlineBlock block;

  void start(Capture what, const char *type) {
    capture = what;
    depth = 1;
    block = OutlineBlock{};
    block.type = type;
  }

  void append(const std::string &text) {
    if (capture == Capture::List) {
      if (!block.items.empty()) {
        block.items.back() += text;
      }
      return;
    }
    block.text += text;
  }

  void add(OutlineBlock done) {
    if (outline.sections.empty()) {
      outline.preamble.push_back(std::move(done));
    } else {
      outline.sections.back().blocks.push_back(std::move(done));
    }
  }

  void finish() {
    switch (capture) {
    case Capture::Heading: {
      OutlineSection section;
      section.level = heading_level;
      section.title = boost::trim_copy(block.text);
      section.id = DocumentOutline::section_id(section.title);
      outline.sections.push_back(std::move(section));
      break;
    }
    case Capture::Paragraph:
    case Capture::Quote:
      boost::trim(block.text);
      if (!block.text.empty()) {
        add(std::move(block));
      }
      break;
    case Capture::List:
      for (auto &item : block.items) {
        boost::trim(item);
      }
      add(std::move(block));
      break;
    case Capture::Code:
      add(std::move(block));
      break;
    case Capture::None:
      break;
    }
    capture = Capture::None;
    depth = 0;
  }
};

int enter_block(MD_BLOCKTYPE type, void *detail, void *userdata) {
  auto &builder = *static_cast<OutlineBuilder *>(userdata);

  if (builder.capture != Capture::None) {
    ++builder.depth;
    if (builder.capture == Capture::List && type == MD_BLOCK_LI &&
        builder.depth == 2) {
      builder.block.items.emplace_back();
    } else if (type == MD_BLOCK_P || type == MD_BLOCK_LI) {
      // Nested paragraphs and list items run on as text.
      const auto &items = builder.block.items;
      const bool has_text = builder.capture == Capture::List
                                ? !items.empty() && !items.back().empty()
                                : !builder.block.text.empty();
      if (has_text) {
        builder.append(builder.capture == Capture::Quote ? "\n" : " ");
      }
    }
    return 0;
  }

  switch (type) {
  case MD_BLOCK_H:
    builder.start(Capture::Heading, "heading");
    builder.heading_level =
        static_cast<int>(static_cast<MD_BLOCK_H_DETAIL *>(detail)->level);
    break;
  case MD_BLOCK_P:
    builder.start(Capture::Paragraph, "paragraph");
    break;
  case MD_BLOCK_UL:
  case MD_BLOCK_OL:
    builder.start(Capture::List, "list");
    builder.block.style = type == MD_BLOCK_OL ? "ordered" : "bullet";
    break;
  case MD_BLOCK_CODE: {
    builder.start(Capture::Code, "code");
    const auto *code = static_cast<MD_BLOCK_CODE_DETAIL *>(detail);
    if (code->lang.text != nullptr) {
      builder.block.language.assign(code->lang.text, code->lang.size);
    }
    break;
  }
  case MD_BLOCK_QUOTE:
    builder.start(Capture::Quote, "quote");
    break;
  default:
    break;
  }
  return 0;
}

int leave_block(MD_BLOCKTYPE, void *, void *userdata) {
  auto &builder = *static_cast<OutlineBuilder *>(userdata);
  if (builder.capture != Capture::None && --builder.depth == 0) {
    builder.finish();
  }
  return 0;
}

int enter_span(MD_SPANTYPE, void *, void *) { return 0; }
int leave_span(MD_SPANTYPE, void *, void *) { return 0; }

int on_text(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
            void *userdata) {
  auto &builder = *static_cast<OutlineBuilder *>(userdata);
  if (builder.capture == Capture::None) {
    return 0;
  }

  switch (type) {
  case MD_TEXT_NULLCHAR:
    builder.append("\xEF\xBF\xBD");
    break;
  case MD_TEXT_BR:
    builder.append("\n");
    break;
  case MD_TEXT_SOFTBR:
    builder.append(" ");
    break;
  case MD_TEXT_ENTITY:
    builder.append(decode_entity(std::string(text, size)));
    break;
  case MD_TEXT_HTML:
    // Inline tags; the text between them arrives as normal text.
    break;
  default:
    builder.append(std::string(text, size));
    break;
  }
  return 0;
}

nlohmann::json block_json(const OutlineBlock &block) {
  nlohmann::json out = {{"type", block.type}};
  if (block.type == "list") {
    out["style"] = block.style;
    out["items"] = block.items;
  } else {
    out["text"] = block.text;
    if (!block.language.empty()) {
      out["language"] = block.language;
    }
  }
  return out;
}

void write_xml_block(std::ostream &out, const OutlineBlock &block,
                     const std::string &pad) {
  if (block.type == "list") {
    out << pad << "<list type=\"" << block.style << "\">\n";
    for (const auto &item : block.items) {
      out << pad << "  <item>" << escape_xml(item) << "</item>\n";
    }
    out << pad << "</list>\n";
  } else if (block.type == "code") {
    out << pad << "<code";
    if (!block.language.empty()) {
      out << " language=\"" << escape_xml(block.language) << "\"";
    }
    out << ">" << escape_xml(block.text) << "</code>\n";
  } else {
    const char *tag = block.type == "quote" ? "quote" : "paragraph";
    out << pad << "<" << tag << ">" << escape_xml(block.text) << "</" << tag
        << ">\n";
  }
}

void write_plain_block(std::ostream &out, const OutlineBlock &block) {
  if (block.type == "list") {
    for (size_t i = 0; i < block.items.size(); ++i) {
      if (block.style == "ordered") {
        out << (i + 1) << ". ";
      } else {
        out << "- ";
      }
      out << block.items[i] << "\n";
    }
  } else if (block.type == "code") {
    std::istringstream lines(block.text);
    std::string line;
    while (std::getline(lines, line)) {
      out << "    " << line << "\n";
    }
  } else if (block.type == "quote") {
    std::istringstream lines(block.text);
    std::string line;
    while (std::getline(lines, line)) {
      out << "  " << line << "\n";
    }
  } else {
    out << block.text << "\n";
  }
}

} // namespace

std::string escape_xml(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

DocumentOutline DocumentOutline::parse(const std::string &markdown) {
  MD_PARSER parser{};
  parser.abi_version = 0;
  parser.flags = MD_DIALECT_GITHUB;
  parser.enter_block = enter_block;
  parser.leave_block = leave_block;
  parser.enter_span = enter_span;
  parser.leave_span = leave_span;
  parser.text = on_text;

  OutlineBuilder builder;
  if (md_parse(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()),
               &parser, &builder) != 0) {
    throw ConversionError("", "md4c failed to parse the document");
  }
  return std::move(builder.outline);
}

std::string DocumentOutline::section_id(const std::string &title) {
  std::string kept;
  for (char c : title) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) && uc < 0x80) {
      kept += static_cast<char>(std::tolower(uc));
    } else if (std::isspace(uc) || c == '-') {
      kept += c;
    }
  }
  boost::trim(kept);
  boost::replace_all(kept, " ", "-");
  return kept;
}

nlohmann::json DocumentOutline::to_json() const {
  nlohmann::json out;
  if (!preamble.empty()) {
    out["preamble"] = nlohmann::json::array();
    for (const auto &block : preamble) {
      out["preamble"].push_back(block_json(block));
    }
  }

  out["sections"] = nlohmann::json::array();
  for (const auto &section : sections) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto &block : section.blocks) {
      content.push_back(block_json(block));
    }
    out["sections"].push_back({{"id", section.id},
                               {"level", section.level},
                               {"title", section.title},
                               {"content", content}});
  }
  return out;
}

std::string DocumentOutline::to_xml(int indent) const {
  const std::string pad(static_cast<size_t>(indent), ' ');
  std::ostringstream out;

  for (const auto &block : preamble) {
    write_xml_block(out, block, pad);
  }
  for (const auto &section : sections) {
    out << pad << "<section id=\"" << escape_xml(section.id) << "\" level=\""
        << section.level << "\">\n";
    out << pad << "  <title>" << escape_xml(section.title) << "</title>\n";
    for (const auto &block : section.blocks) {
      write_xml_block(out, block, pad + "  ");
    }
    out << pad << "</section>\n";
  }
  return out.str();
}

std::string DocumentOutline::to_plain() const {
  std::ostringstream out;
  bool first = true;
  auto separate = [&] {
    if (!first) {
      out << "\n";
    }
    first = false;
  };

  for (const auto &block : preamble) {
    separate();
    write_plain_block(out, block);
  }
  for (const auto &section : sections) {
    separate();
    out << section.title << "\n";
    for (const auto &block : section.blocks) {
      separate();
      write_plain_block(out, block);
    }
  }
  return out.str();
}
