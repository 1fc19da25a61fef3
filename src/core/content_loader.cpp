#include "content_loader.hpp"
#include "utils/logging.hpp"

#include <boost/locale/encoding_utf.hpp>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {

bool is_hidden(const fs::path &relative) {
  for (const auto &part : relative) {
    const std::string name = part.string();
    if (!name.empty() && name[0] == '.') {
      return true;
    }
  }
  return false;
}

} // namespace

bool ContentLoader::is_content_file(const fs::path &path) {
  const std::string name = path.filename().string();
  if (name.empty() || name[0] == '.' || name.back() == '~') {
    return false;
  }

  const std::string ext = path.extension().string();
  return ext == ".md" || ext == ".markdown";
}

ContentItem ContentLoader::load_file(const fs::path &file,
                                     const fs::path &relative) {
  const std::string source = relative.generic_string();

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    throw LoadError(source, "cannot open file");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw LoadError(source, "read error");
  }
  std::string raw = buffer.str();

  try {
    boost::locale::conv::utf_to_utf<char>(raw, boost::locale::conv::stop);
  } catch (const boost::locale::conv::conversion_error &) {
    throw LoadError(source, "file is not valid UTF-8");
  }

  try {
    auto [fm, body] = FrontMatter::parse(raw);
    return ContentItem::create(relative, std::move(fm), std::move(body));
  } catch (const LoadError &e) {
    throw LoadError(source, e.reason());
  }
}

LoadResult ContentLoader::load(const fs::path &content_root,
                               const LoadOptions &options) {
  LoadResult result;

  if (!fs::is_directory(content_root)) {
    LOG_WARN << "Content directory not found: " << content_root;
    return result;
  }

  std::error_code ec;
  fs::recursive_directory_iterator it(
      content_root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    result.errors.emplace_back(content_root.string(), ec.message());
    return result;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }

    const auto &entry = *it;
    fs::path relative = fs::relative(entry.path(), content_root);

    if (entry.is_directory() && is_hidden(relative.filename())) {
      it.disable_recursion_pending();
      continue;
    }

    if (!entry.is_regular_file() || !is_content_file(entry.path()) ||
        is_hidden(relative)) {
      continue;
    }

    try {
      ContentItem item = load_file(entry.path(), relative);

      if (item.is_draft()) {
        result.drafts.push_back(item.source_path.generic_string());
        if (!options.include_drafts) {
          LOG_INFO << "Skipping draft " << item.source_path;
          continue;
        }
      }

      LOG_TRACE << "Loaded " << item.source_path << " (" << item.kind
                << ") --> " << item.output_path;
      result.items.push_back(std::move(item));
    } catch (const LoadError &e) {
      LOG_WARN << "Failed to load " << e.path() << ": " << e.reason();
      result.errors.push_back(e);
    }
  }

  // A failed increment leaves the iterator at end.
  if (ec) {
    LOG_WARN << "Directory scan error under " << content_root << ": "
             << ec.message();
    result.errors.emplace_back(content_root.string(), ec.message());
  }

  return result;
}
