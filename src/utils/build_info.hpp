#pragma once

#include <algorithm>
#include <boost/container_hash/hash.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#ifndef QUIRE_VERSION
#define QUIRE_VERSION "0.0.0"
#endif

// Program version and the id of the most recent build. Templates get the
// build id as `site.build` for cache busting (`style.css?v={{ site.build }}`).
// The id is a fingerprint of the build inputs, so unchanged sources give the
// same id and byte-identical output.
class BuildInfo {
private:
  mutable std::mutex mutex;
  std::string build_id_;

  BuildInfo() {}

  static void hash_file(std::size_t &seed, const std::filesystem::path &file,
                        const std::string &name) {
    std::ifstream in(file, std::ios::binary);
    const std::string data((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    boost::hash_combine(seed, name);
    boost::hash_combine(seed, data);
  }

public:
  BuildInfo(const BuildInfo &) = delete;
  BuildInfo &operator=(const BuildInfo &) = delete;

  static BuildInfo &getInstance() {
    static BuildInfo instance;
    return instance;
  }

  static const char *version() { return QUIRE_VERSION; }

  std::string build_id() const {
    std::lock_guard<std::mutex> lock(mutex);
    return build_id_;
  }

  // Hash of the names and contents of `inputs`: regular files, and
  // directories walked recursively in name order. Missing inputs are
  // skipped. Returns 16 hex digits and remembers them as build_id().
  std::string generate_build_id(const std::vector<std::filesystem::path> &inputs) {
    namespace fs = std::filesystem;
    std::size_t seed = 0;

    for (const auto &input : inputs) {
      std::error_code ec;
      if (fs::is_regular_file(input, ec)) {
        hash_file(seed, input, input.filename().generic_string());
        continue;
      }
      if (!fs::is_directory(input, ec)) {
        continue;
      }

      std::vector<fs::path> files;
      for (fs::recursive_directory_iterator it(input, ec), end;
           !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
          files.push_back(it->path());
        }
      }
      std::sort(files.begin(), files.end());

      boost::hash_combine(seed, input.filename().generic_string());
      for (const auto &file : files) {
        hash_file(seed, file, file.lexically_relative(input).generic_string());
      }
    }

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(seed));

    std::lock_guard<std::mutex> lock(mutex);
    build_id_ = hex;
    return build_id_;
  }
};
