#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include "lest/lest.hpp"
#include "utils/logging.hpp"

namespace {

#define STARTCASE(name) { CASE(#name) { \
    LOG_DEBUG << "================================"; \
    LOG_INFO << "Test case: " << #name; \
    LOG_DEBUG << "================================";

#define ENDCASE \
    LOG_DEBUG << "============== ENDCASE ============="; \
}},

template<typename T1, typename T2>
bool compare(const T1& left, const T2& right) {
    const auto state = (left == right);
    if (!state) {
        std::cerr << ">>>> '" << left << "' is not equal to '" << right << "'" << std::endl;
    }
    return state;
}

bool contains(const std::string& haystack, const std::string& needle) {
    if (haystack.find(needle) == std::string::npos) {
        std::cerr << ">>>> '" << needle << "' not found in '" << haystack << "'" << std::endl;
        return false;
    }
    return true;
}

// A throw-away site tree under the system temp directory, removed when the
// fixture goes out of scope.
class TempSite {
public:
    TempSite() {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path()
            / ("quire-test-" + std::to_string(::getpid()) + "-"
               + std::to_string(counter++));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    ~TempSite() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempSite(const TempSite&) = delete;
    TempSite& operator = (const TempSite&) = delete;

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path path(const std::string& relative) const {
        return root_ / relative;
    }

    void write(const std::string& relative, const std::string& content) const {
        const auto target = path(relative);
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read(const std::string& relative) const {
        std::ifstream in(path(relative), std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    bool exists(const std::string& relative) const {
        return std::filesystem::exists(path(relative));
    }

    std::filesystem::file_time_type mtime(const std::string& relative) const {
        return std::filesystem::last_write_time(path(relative));
    }

    // Minimal templates for the post/page/default ids.
    void write_basic_templates() const {
        write("templates/default.html",
              "<html><title>{{ page.title }}</title><body>{{ page.content }}</body></html>");
        write("templates/post.html",
              "<article><h1>{{ page.title }}</h1>{{ page.content }}</article>");
    }

private:
    std::filesystem::path root_;
};

void set_test_log_level() {
    namespace logging = boost::log;
    logging::core::get()->set_filter
    (
        logging::trivial::severity >= logging::trivial::warning
    );
}

} // anonymous namespace

#define CHECK_EQUAL(a,b) EXPECT(compare(a,b))
#define CHECK_EQUAL_ENUM(a,b) EXPECT(compare(static_cast<int>(a), static_cast<int>(b)))
#define CHECK_CONTAINS(haystack, needle) EXPECT(contains(haystack, needle))
#define TEST(name) CASE(#name)
