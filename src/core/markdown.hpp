#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include "utils/config.hpp"
#include <memory>
#include <string>

// Outcome of a converter availability check, used by `quire doctor`.
struct Availability {
  bool available = false;
  std::string version;
  std::string detail;
};

// Converts a content body from one markup format to another. Implementations
// keep no per-call state, so one instance serves all build threads.
class MarkupConverter {
public:
  virtual ~MarkupConverter() = default;

  // Throws ConversionError. The error carries no path; the caller knows the
  // item.
  virtual std::string convert(const std::string &body,
                              const std::string &from_format,
                              const std::string &to_format = "html") const = 0;

  virtual std::string name() const = 0;
  virtual Availability check() const = 0;

  static std::unique_ptr<MarkupConverter> create(const ConverterConfig &config);
};

// In-process markdown to HTML with md4c (GitHub dialect).
class Md4cConverter : public MarkupConverter {
public:
  std::string convert(const std::string &body, const std::string &from_format,
                      const std::string &to_format = "html") const override;

  std::string name() const override { return "md4c"; }
  Availability check() const override;

  static bool accepts(const std::string &from_format);
};

// Runs the external pandoc executable once per conversion.
class PandocConverter : public MarkupConverter {
public:
  explicit PandocConverter(ConverterConfig config) : config(std::move(config)) {}

  std::string convert(const std::string &body, const std::string &from_format,
                      const std::string &to_format = "html") const override;

  std::string name() const override { return "pandoc"; }
  Availability check() const override;

private:
  ConverterConfig config;
};

#endif
