#include "logging.hpp"

#include <map>
#include <optional>
#include <string_view>

namespace logging = boost::log;

bool init_logging(const std::string &level) {
  const static std::map<std::string_view, logging::trivial::severity_level>
      mapping = {{"error", logging::trivial::error},
                 {"warning", logging::trivial::warning},
                 {"warn", logging::trivial::warning},
                 {"info", logging::trivial::info},
                 {"debug", logging::trivial::debug},
                 {"trace", logging::trivial::trace}};

  if (level.empty() || level == "off" || level == "false") {
    logging::core::get()->set_logging_enabled(false);
    return true;
  }

  auto it = mapping.find(level);
  if (it == mapping.end()) {
    return false;
  }

  logging::core::get()->set_logging_enabled(true);
  logging::core::get()->set_filter(logging::trivial::severity >= it->second);
  return true;
}
