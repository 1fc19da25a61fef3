#include "build_result.hpp"

#include <algorithm>
#include <iomanip>
#include <termcolor/termcolor.hpp>

int BuildResult::count(ErrorKind kind) const {
  return static_cast<int>(
      std::count_if(errors.begin(), errors.end(),
                    [kind](const BuildError &e) { return e.kind == kind; }));
}

bool BuildResult::has_fatal_error() const {
  return std::any_of(errors.begin(), errors.end(),
                     [](const BuildError &e) { return is_fatal(e.kind); });
}

void BuildResult::print_summary(std::ostream &out) const {
  if (!errors.empty()) {
    out << "\n"
        << termcolor::bright_red << "✗ " << errors.size() << " error"
        << (errors.size() == 1 ? "" : "s") << termcolor::reset << "\n";
    for (const auto &e : errors) {
      out << termcolor::bright_red << "  ✗ " << termcolor::reset
          << termcolor::yellow << e.kind << termcolor::reset << " "
          << termcolor::white << e.path << termcolor::reset
          << termcolor::bright_blue << ": " << e.message << termcolor::reset
          << "\n";
    }
  }

  if (!drafts.empty()) {
    out << "\n"
        << termcolor::yellow << "⚠ Drafts: " << termcolor::reset;
    for (size_t i = 0; i < drafts.size(); ++i) {
      out << (i ? ", " : "") << drafts[i];
    }
    out << "\n";
  }

  auto row = [&out](const char *label, const std::string &value) {
    out << termcolor::bright_green << "║  " << termcolor::reset << label
        << termcolor::bright_white << std::setw(32) << std::left << value
        << termcolor::reset << termcolor::bright_green << "║"
        << termcolor::reset << "\n";
  };

  if (success) {
    out << "\n"
        << termcolor::bright_green
        << "╔═══════════════════════════════════════════╗\n"
        << "║           ✨ Build Complete!              ║\n"
        << "╠═══════════════════════════════════════════╣" << termcolor::reset
        << "\n";
  } else {
    out << "\n"
        << termcolor::bright_red
        << "╔═══════════════════════════════════════════╗\n"
        << "║           ✗ Build Failed                  ║\n"
        << "╠═══════════════════════════════════════════╣" << termcolor::reset
        << "\n";
  }

  row("Output: ", output_dir.string());
  row("Time:   ", std::to_string(duration.count()) + "ms");
  row("Pages:  ", std::to_string(items_rendered) + " of " +
                      std::to_string(items_total) + " (" +
                      std::to_string(items_failed) + " failed)");
  row("Lists:  ", std::to_string(listing_pages));
  row("Static: ", std::to_string(static_files));

  if (success) {
    out << termcolor::bright_green;
  } else {
    out << termcolor::bright_red;
  }
  out << "╚═══════════════════════════════════════════╝" << termcolor::reset
      << "\n\n";
}
