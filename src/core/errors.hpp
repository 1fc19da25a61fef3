#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <ostream>
#include <stdexcept>
#include <string>

enum class ErrorKind {
  Config,
  Load,
  Conversion,
  TemplateNotFound,
  Render,
  Write
};

// Config and Write errors end the build. Everything else is isolated to the
// content item it happened for.
inline bool is_fatal(ErrorKind kind) {
  return kind == ErrorKind::Config || kind == ErrorKind::Write;
}

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Config:
    return "ConfigError";
  case ErrorKind::Load:
    return "LoadError";
  case ErrorKind::Conversion:
    return "ConversionError";
  case ErrorKind::TemplateNotFound:
    return "TemplateNotFoundError";
  case ErrorKind::Render:
    return "RenderError";
  case ErrorKind::Write:
    return "WriteError";
  }
  return "UnknownError";
}

inline std::ostream &operator<<(std::ostream &out, ErrorKind kind) {
  return out << to_string(kind);
}

class QuireError : public std::runtime_error {
private:
  std::string path_;
  std::string reason_;

public:
  QuireError(const std::string &path, const std::string &reason)
      : std::runtime_error(path.empty() ? reason : path + ": " + reason),
        path_(path), reason_(reason) {}

  virtual ErrorKind kind() const = 0;

  // File (or template id) the error is about. May be empty.
  const std::string &path() const { return path_; }

  // Message without the path prefix.
  const std::string &reason() const { return reason_; }
};

class ConfigError : public QuireError {
public:
  using QuireError::QuireError;
  ErrorKind kind() const override { return ErrorKind::Config; }
};

class LoadError : public QuireError {
public:
  using QuireError::QuireError;
  ErrorKind kind() const override { return ErrorKind::Load; }
};

class ConversionError : public QuireError {
public:
  using QuireError::QuireError;
  ErrorKind kind() const override { return ErrorKind::Conversion; }
};

class TemplateNotFoundError : public QuireError {
private:
  std::string requested_name_;

public:
  TemplateNotFoundError(const std::string &requested_name,
                        const std::string &item_path)
      : QuireError(item_path, "template '" + requested_name +
                                  "' not found on the template search path"),
        requested_name_(requested_name) {}

  ErrorKind kind() const override { return ErrorKind::TemplateNotFound; }
  const std::string &requested_name() const { return requested_name_; }
  const std::string &item_path() const { return path(); }
};

class RenderError : public QuireError {
public:
  RenderError(const std::string &template_id, const std::string &message)
      : QuireError(template_id, message) {}

  ErrorKind kind() const override { return ErrorKind::Render; }
  const std::string &template_id() const { return path(); }
};

class WriteError : public QuireError {
public:
  using QuireError::QuireError;
  ErrorKind kind() const override { return ErrorKind::Write; }
};

#endif
