#ifndef CONTENT_LOADER_HPP
#define CONTENT_LOADER_HPP

#include "content_item.hpp"
#include "errors.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct LoadOptions {
  // Yield items marked `draft: true` as buildable items.
  bool include_drafts = false;
};

struct LoadResult {
  // Buildable items, in filesystem traversal order.
  std::vector<ContentItem> items;
  // Source paths of drafts held back from the build.
  std::vector<std::string> drafts;
  std::vector<LoadError> errors;
};

class ContentLoader {
public:
  // Scan `content_root` recursively. A bad file never aborts the scan: it is
  // reported in `errors` and left out of `items`.
  static LoadResult load(const fs::path &content_root,
                         const LoadOptions &options = {});

  // Parse one file. `relative` becomes the item's source path. Throws
  // LoadError.
  static ContentItem load_file(const fs::path &file, const fs::path &relative);

  static bool is_content_file(const fs::path &path);
};

#endif
