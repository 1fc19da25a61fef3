#ifndef BUILD_RESULT_HPP
#define BUILD_RESULT_HPP

#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct BuildError {
  ErrorKind kind;
  // Source path, template id or output path, depending on the kind.
  std::string path;
  std::string message;

  static BuildError from(const QuireError &e) {
    return {e.kind(), e.path(), e.reason()};
  }
};

struct BuildResult {
  int items_total = 0;
  int items_rendered = 0;
  int items_failed = 0;
  int listing_pages = 0;
  int static_files = 0;
  std::vector<std::string> drafts;
  std::vector<BuildError> errors;
  bool success = false;
  fs::path output_dir;
  std::chrono::milliseconds duration{0};

  void add_error(const QuireError &e) { errors.push_back(BuildError::from(e)); }

  int count(ErrorKind kind) const;
  bool has_fatal_error() const;

  // Coloured report in the same style as the build progress output.
  void print_summary(std::ostream &out) const;

  int exit_code() const { return success ? 0 : 1; }
};

#endif
