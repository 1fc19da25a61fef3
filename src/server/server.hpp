#pragma once

#include "utils/logging.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <unordered_map>

struct Request {
  std::string method;
  std::string path;
  std::string version;
  std::unordered_map<std::string, std::string> headers;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  void set_content(const std::string &content, const std::string &type) {
    body = content;
    headers["Content-Type"] = type;
  }

  std::string to_http(bool include_body = true) const {
    std::ostringstream oss;

    oss << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    if (include_body) {
      oss << body;
    }
    return oss.str();
  }

  static const char *status_text(int code) {
    switch (code) {
    case 200:
      return "OK";
    case 301:
      return "Moved Permanently";
    case 400:
      return "Bad Request";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 500:
      return "Internal Server Error";
    default:
      return "Unknown";
    }
  }
};

using Logger = std::function<void(const Request &, const Response &)>;

// Minimal HTTP/1.1 file server for a built site. One request per connection,
// GET and HEAD only.
class Server {
private:
  std::atomic<int> server_fd{-1};
  std::atomic<bool> running{false};
  std::atomic<bool> stopped{false};
  std::filesystem::path root;
  Logger logger;

  static Request parse_request(const std::string &raw) {
    Request req;
    std::istringstream iss(raw);
    std::string line;

    if (std::getline(iss, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      std::istringstream line_stream(line);
      line_stream >> req.method >> req.path >> req.version;
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
      if (line.back() == '\r') {
        line.pop_back();
      }
      size_t colon = line.find(':');
      if (colon != std::string::npos) {
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(' ');
        req.headers[line.substr(0, colon)] =
            start == std::string::npos ? "" : value.substr(start);
      }
    }

    return req;
  }

  static bool ends_with(const std::string &str, const std::string &suffix) {
    if (suffix.size() > str.size())
      return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  static bool read_file(const std::filesystem::path &path, std::string &out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)),
               std::istreambuf_iterator<char>());
    return true;
  }

  void handle_client(int client_fd) {
    char buffer[8192];
    ssize_t bytes = recv(client_fd, buffer, sizeof(buffer) - 1, 0);

    if (bytes <= 0) {
      close(client_fd);
      return;
    }

    buffer[bytes] = '\0';
    Request req = parse_request(std::string(buffer, bytes));
    Response res = handle(req);

    if (logger) {
      logger(req, res);
    }

    std::string response = res.to_http(req.method != "HEAD");
    size_t sent = 0;
    while (sent < response.size()) {
      ssize_t n = send(client_fd, response.data() + sent,
                       response.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        LOG_DEBUG << "send failed: " << strerror(errno);
        break;
      }
      sent += static_cast<size_t>(n);
    }
    close(client_fd);
  }

public:
  // How a request path maps onto the served directory.
  struct Resolution {
    int status = 200;
    std::filesystem::path file;
    // Redirect target for 301.
    std::string location;
  };

  explicit Server(std::filesystem::path root) : root(std::move(root)) {}
  ~Server() { stop(); }

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  void set_logger(Logger log_handler) { logger = std::move(log_handler); }

  static std::string url_decode(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
      if (in[i] == '%' && i + 2 < in.size() &&
          std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
          std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
        out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
        i += 2;
      } else {
        out += in[i];
      }
    }
    return out;
  }

  static std::string get_mime_type(const std::string &path) {
    if (ends_with(path, ".html") || ends_with(path, ".htm"))
      return "text/html; charset=utf-8";
    if (ends_with(path, ".css"))
      return "text/css";
    if (ends_with(path, ".js"))
      return "application/javascript";
    if (ends_with(path, ".json"))
      return "application/json";
    if (ends_with(path, ".png"))
      return "image/png";
    if (ends_with(path, ".jpg") || ends_with(path, ".jpeg"))
      return "image/jpeg";
    if (ends_with(path, ".gif"))
      return "image/gif";
    if (ends_with(path, ".webp"))
      return "image/webp";
    if (ends_with(path, ".svg"))
      return "image/svg+xml";
    if (ends_with(path, ".ico"))
      return "image/x-icon";
    if (ends_with(path, ".woff"))
      return "font/woff";
    if (ends_with(path, ".woff2"))
      return "font/woff2";
    if (ends_with(path, ".ttf"))
      return "font/ttf";
    if (ends_with(path, ".pdf"))
      return "application/pdf";
    if (ends_with(path, ".xml"))
      return "application/xml";
    if (ends_with(path, ".txt") || ends_with(path, ".md"))
      return "text/plain; charset=utf-8";
    return "application/octet-stream";
  }

  // Map `url_path` (query string allowed) to a file under `root`.
  static Resolution resolve(const std::filesystem::path &root,
                            const std::string &url_path) {
    Resolution result;

    std::string path = url_path.substr(0, url_path.find_first_of("?#"));
    path = url_decode(path);

    if (path.empty() || path[0] != '/') {
      result.status = 400;
      return result;
    }

    std::filesystem::path relative(path.substr(1));
    if (relative.has_root_path()) {
      result.status = 403;
      return result;
    }
    for (const auto &part : relative) {
      if (part == "..") {
        result.status = 403;
        return result;
      }
    }

    std::filesystem::path target = root / relative;

    if (std::filesystem::is_directory(target)) {
      if (path.back() != '/') {
        result.status = 301;
        result.location = path + "/";
        return result;
      }
      target /= "index.html";
    }

    if (!std::filesystem::is_regular_file(target)) {
      result.status = 404;
      return result;
    }

    result.file = target;
    return result;
  }

  Response handle(const Request &req) const {
    Response res;

    if (req.method != "GET" && req.method != "HEAD") {
      res.status = 405;
      res.headers["Allow"] = "GET, HEAD";
      res.set_content("<h1>405 - Method Not Allowed</h1>", "text/html");
      return res;
    }

    const Resolution resolved = resolve(root, req.path);
    res.status = resolved.status;

    switch (resolved.status) {
    case 200: {
      std::string body;
      if (read_file(resolved.file, body)) {
        res.set_content(body, get_mime_type(resolved.file.string()));
        res.headers["Cache-Control"] = "no-cache";
      } else {
        res.status = 500;
        res.set_content("<h1>500 - Error loading page</h1>", "text/html");
      }
      break;
    }
    case 301:
      res.headers["Location"] = resolved.location;
      break;
    case 403:
      res.set_content("<h1>403 - Forbidden</h1>", "text/html");
      break;
    case 404: {
      std::string body;
      if (read_file(root / "404.html", body)) {
        res.set_content(body, "text/html; charset=utf-8");
      } else {
        res.set_content("<h1>404 - Page Not Found</h1><p>The page you're "
                        "looking for doesn't exist.</p>",
                        "text/html");
      }
      break;
    }
    default:
      res.set_content("<h1>400 - Bad Request</h1>", "text/html");
      break;
    }

    return res;
  }

  // IPv4 address of `host`, a dotted quad or a name such as `localhost`.
  static bool resolve_host(const std::string &host, in_addr &out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
      return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *found = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
      LOG_ERROR << "Cannot resolve listen address " << host << ": "
                << (rc != 0 ? gai_strerror(rc) : "no IPv4 address");
      return false;
    }
    out = reinterpret_cast<const sockaddr_in *>(found->ai_addr)->sin_addr;
    freeaddrinfo(found);
    return true;
  }

  bool listen(const std::string &host, int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == -1) {
      LOG_ERROR << "Failed to create socket: " << strerror(errno);
      return false;
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
      LOG_WARN << "Failed to set SO_REUSEADDR: " << strerror(errno);
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (!resolve_host(host, addr.sin_addr)) {
      close(fd);
      return false;
    }

    if (bind(fd, (sockaddr *)&addr, sizeof(addr)) < 0) {
      LOG_ERROR << "Bind failed on port " << port << ": " << strerror(errno)
                << ". Port may already be in use. Try: lsof -i :" << port;
      close(fd);
      return false;
    }

    if (::listen(fd, 16) < 0) {
      LOG_ERROR << "Listen failed: " << strerror(errno);
      close(fd);
      return false;
    }

    server_fd = fd;
    running = true;

    // stop() may have run before the socket was published.
    if (stopped) {
      running = false;
      int published = server_fd.exchange(-1);
      if (published != -1) {
        close(published);
      }
      return true;
    }

    while (running) {
      sockaddr_in client_addr{};
      socklen_t client_len = sizeof(client_addr);
      int client_fd = accept(fd, (sockaddr *)&client_addr, &client_len);

      if (client_fd < 0) {
        if (running) {
          LOG_WARN << "Accept failed: " << strerror(errno);
        }
        continue;
      }

      handle_client(client_fd);
    }

    return true;
  }

  bool is_running() const { return running; }

  void stop() {
    stopped = true;
    running = false;
    int fd = server_fd.exchange(-1);
    if (fd != -1) {
      shutdown(fd, SHUT_RDWR);
      close(fd);
    }
  }
};
