#include "site_builder.hpp"
#include "content_loader.hpp"
#include "template_engine.hpp"
#include "utils/build_info.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <system_error>
#include <termcolor/termcolor.hpp>
#include <thread>

namespace {

// Run fn(0..count-1) on a pool of `threads` workers. `fn` must not throw;
// each call only writes to its own result slot.
template <typename Fn> void run_parallel(size_t count, unsigned threads, Fn fn) {
  if (threads <= 1 || count <= 1) {
    for (size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  boost::asio::thread_pool pool(
      static_cast<std::size_t>(std::min<size_t>(threads, count)));
  for (size_t i = 0; i < count; ++i) {
    boost::asio::post(pool, [&fn, i] { fn(i); });
  }
  pool.join();
}

nlohmann::json item_list(const std::vector<const ContentItem *> &list,
                         const std::string &base_url) {
  nlohmann::json result = nlohmann::json::array();
  for (const auto *item : list) {
    result.push_back(item->to_json(base_url));
  }
  return result;
}

std::string page_url(size_t page_number) {
  return page_number <= 1 ? "/" : "/page/" + std::to_string(page_number) + "/";
}

// True when `path` is `dir` or lies below it. Both are canonical.
bool is_within(const fs::path &path, const fs::path &dir) {
  const fs::path relative = path.lexically_relative(dir);
  return !relative.empty() && relative.begin()->string() != "..";
}

fs::path page_output(size_t page_number) {
  if (page_number <= 1) {
    return "index.html";
  }
  return fs::path("page") / std::to_string(page_number) / "index.html";
}

} // namespace

SiteBuilder::SiteBuilder(fs::path root, BuildOptions options)
    : project_root(std::move(root)), options(std::move(options)) {}

std::vector<std::vector<size_t>> SiteBuilder::paginate(size_t count,
                                                       int per_page) {
  std::vector<std::vector<size_t>> pages;
  const size_t size = per_page > 0 ? static_cast<size_t>(per_page) : count;

  for (size_t i = 0; i < count; i += std::max<size_t>(size, 1)) {
    std::vector<size_t> page;
    for (size_t j = i; j < count && j < i + size; ++j) {
      page.push_back(j);
    }
    pages.push_back(std::move(page));
  }

  if (pages.empty()) {
    pages.emplace_back();
  }
  return pages;
}

void SiteBuilder::sort_posts(std::vector<const ContentItem *> &list) {
  std::sort(list.begin(), list.end(),
            [](const ContentItem *a, const ContentItem *b) {
              const std::string a_date = a->date();
              const std::string b_date = b->date();
              if (a_date != b_date) {
                return a_date > b_date;
              }
              return a->source_path.generic_string() <
                     b->source_path.generic_string();
            });
}

fs::path SiteBuilder::guarded_output_dir(const fs::path &root,
                                         const SiteConfig &config) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::absolute(root), ec);
  if (ec) {
    throw ConfigError(root.string(), "cannot resolve site root: " +
                                         ec.message());
  }

  auto resolve = [&](const std::string &key, const std::string &dir) {
    fs::path target = fs::path(dir);
    if (target.is_relative()) {
      target = base / target;
    }
    target = fs::weakly_canonical(target, ec);
    if (ec) {
      throw ConfigError(key, "cannot resolve '" + dir + "': " + ec.message());
    }
    return target;
  };

  const std::string &output = config.output_dir;
  const fs::path target = resolve("output_dir", output);

  if (target == base || !is_within(target, base)) {
    throw ConfigError("output_dir",
                      "'" + output + "' must be a subdirectory of the site root");
  }

  // The output directory is wiped on every build.
  const std::pair<const char *, const std::string *> sources[] = {
      {"content_dir", &config.content_dir},
      {"templates_dir", &config.templates_dir},
      {"static_dir", &config.static_dir}};
  for (const auto &[key, dir] : sources) {
    const fs::path source = resolve(key, *dir);
    if (is_within(target, source) || is_within(source, target)) {
      throw ConfigError("output_dir", "'" + output + "' overlaps " + key +
                                          " '" + *dir + "'");
    }
  }
  return target;
}

unsigned SiteBuilder::thread_count() const {
  if (options.concurrency > 0) {
    return options.concurrency;
  }
  if (config.concurrency > 0) {
    return config.concurrency;
  }
  return std::max(1u, std::thread::hardware_concurrency());
}

std::vector<std::string> SiteBuilder::formats() const {
  return options.formats.empty() ? config.output_formats : options.formats;
}

void SiteBuilder::log_processed(const std::string &label, bool ok,
                                const std::string &note) const {
  if (options.quiet) {
    return;
  }

  if (ok) {
    std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
              << termcolor::white << label << termcolor::reset;
  } else {
    std::cout << termcolor::bright_red << "  ✗ " << termcolor::reset
              << termcolor::white << label << termcolor::reset;
  }
  if (!note.empty()) {
    std::cout << termcolor::bright_blue << " " << note << termcolor::reset;
  }
  std::cout << "\n";
}

void SiteBuilder::drop_duplicate_outputs(BuildResult &result) {
  std::sort(items.begin(), items.end(),
            [](const ContentItem &a, const ContentItem &b) {
              return a.source_path.generic_string() <
                     b.source_path.generic_string();
            });

  std::map<std::string, std::string> claimed;
  std::vector<ContentItem> unique;
  unique.reserve(items.size());

  for (auto &item : items) {
    const std::string out = item.output_path.generic_string();
    auto [it, inserted] = claimed.emplace(out, item.source_path.generic_string());
    if (!inserted) {
      result.add_error(LoadError(item.source_path.generic_string(),
                                 "output path '" + out +
                                     "' is already produced by " +
                                     it->second));
      continue;
    }
    unique.push_back(std::move(item));
  }

  items = std::move(unique);
}

void SiteBuilder::convert_all(BuildResult &result) {
  std::vector<std::optional<std::string>> html(items.size());
  std::vector<std::optional<BuildError>> failures(items.size());
  const std::string from = config.converter.from_format;

  run_parallel(items.size(), thread_count(), [&](size_t i) {
    const auto &item = items[i];
    try {
      html[i] = converter->convert(item.body, from, "html");
    } catch (const ConversionError &e) {
      failures[i] = BuildError{ErrorKind::Conversion,
                               item.source_path.generic_string(), e.reason()};
    } catch (const std::exception &e) {
      failures[i] = BuildError{ErrorKind::Conversion,
                               item.source_path.generic_string(), e.what()};
    }
  });

  std::vector<ContentItem> converted;
  converted.reserve(items.size());
  for (size_t i = 0; i < items.size(); ++i) {
    if (failures[i]) {
      LOG_WARN << "Conversion failed for " << failures[i]->path << ": "
               << failures[i]->message;
      log_processed(failures[i]->path, false, failures[i]->message);
      result.errors.push_back(*failures[i]);
      continue;
    }
    items[i].rendered_html = std::move(*html[i]);
    converted.push_back(std::move(items[i]));
  }
  items = std::move(converted);
}

void SiteBuilder::resolve_layouts(BuildResult &result) {
  std::vector<ContentItem> resolved;
  resolved.reserve(items.size());

  for (auto &item : items) {
    try {
      item.layout = resolver->resolve(item);
    } catch (const TemplateNotFoundError &e) {
      LOG_WARN << e.what();
      log_processed(item.source_path.generic_string(), false, e.reason());
      result.add_error(e);
      continue;
    }
    resolved.push_back(std::move(item));
  }
  items = std::move(resolved);
}

void SiteBuilder::build_aggregates() {
  posts.clear();
  pages.clear();
  tags.clear();

  for (const auto &item : items) {
    if (item.kind == ContentKind::Post) {
      posts.push_back(&item);
    } else {
      pages.push_back(&item);
    }
  }
  sort_posts(posts);

  for (const auto *post : posts) {
    for (const auto &tag : post->tags()) {
      tags[tag].push_back(post);
    }
  }

  site_json = config.to_json();
  site_json["build"] = build_id;
  site_json["tags"] = nlohmann::json::object();
  for (const auto &[tag, list] : tags) {
    site_json["tags"][tag] = {
        {"name", tag},
        {"url", "/tags/" + TemplateEngine::slugify(tag) + "/"},
        {"count", list.size()}};
  }

  content_json = item_list(posts, config.base_url());
}

std::vector<SiteBuilder::ListingPage> SiteBuilder::listing_pages() const {
  std::vector<ListingPage> listings;
  const std::string base_url = config.base_url();

  const bool index_claimed =
      std::any_of(items.begin(), items.end(), [](const ContentItem &item) {
        return item.output_path == fs::path("index.html");
      });

  if (resolver->has("index") && !index_claimed) {
    const nlohmann::json pages_json = item_list(pages, base_url);
    const auto groups = paginate(posts.size(), config.paginate);
    for (size_t n = 1; n <= groups.size(); ++n) {
      std::vector<const ContentItem *> page_posts;
      for (size_t index : groups[n - 1]) {
        page_posts.push_back(posts[index]);
      }

      ListingPage listing;
      listing.output_path = page_output(n);
      listing.template_id = "index";
      listing.page = {{"title", config.title},
                      {"url", page_url(n)},
                      {"absolute_url", base_url + page_url(n)},
                      {"kind", "listing"},
                      {"content", ""},
                      {"date", ""},
                      {"tags", nlohmann::json::array()},
                      {"posts", item_list(page_posts, base_url)},
                      {"pages", pages_json}};
      listing.paginator = {
          {"page", n},
          {"per_page", config.paginate},
          {"total_pages", groups.size()},
          {"total_posts", posts.size()},
          {"posts", item_list(page_posts, base_url)},
          {"previous_url", n > 1 ? nlohmann::json(page_url(n - 1))
                                  : nlohmann::json(nullptr)},
          {"next_url",
           n < groups.size() ? nlohmann::json(page_url(n + 1))
                            : nlohmann::json(nullptr)}};
      listings.push_back(std::move(listing));
    }
  }

  if (resolver->has("tag")) {
    std::set<std::string> slugs;
    for (const auto &[tag, list] : tags) {
      const std::string slug = TemplateEngine::slugify(tag);
      if (slug.empty() || !slugs.insert(slug).second) {
        LOG_WARN << "Skipping tag page for '" << tag
                 << "': slug is empty or already taken";
        continue;
      }

      const std::string url = "/tags/" + slug + "/";
      ListingPage listing;
      listing.output_path = fs::path("tags") / slug / "index.html";
      listing.template_id = "tag";
      listing.page = {{"title", tag},
                      {"tag", tag},
                      {"url", url},
                      {"absolute_url", base_url + url},
                      {"kind", "tag"},
                      {"content", ""},
                      {"date", ""},
                      {"tags", nlohmann::json::array()}};
      listing.paginator = {{"page", 1},
                           {"per_page", list.size()},
                           {"total_pages", 1},
                           {"total_posts", list.size()},
                           {"posts", item_list(list, base_url)},
                           {"previous_url", nullptr},
                           {"next_url", nullptr}};
      listings.push_back(std::move(listing));
    }
  }

  return listings;
}

RenderContext SiteBuilder::make_context(nlohmann::json page) const {
  RenderContext context;
  context.site = site_json;
  context.page = std::move(page);
  context.content = content_json;
  return context;
}

SiteBuilder::RenderOutput
SiteBuilder::render_item(const ContentItem &item) const {
  RenderOutput output;
  const std::string source = item.source_path.generic_string();

  try {
    output.files.push_back(
        {item.output_path,
         renderer->render(item.layout,
                          make_context(item.to_json(config.base_url())))});
    output.rendered = true;
  } catch (const RenderError &e) {
    output.errors.push_back(
        {ErrorKind::Render, source, e.template_id() + ": " + e.reason()});
    return output;
  }

  for (const auto &format : formats()) {
    if (format == "html") {
      continue;
    }

    fs::path target = item.output_path;
    target.replace_extension(FormatWriter::extension(format));
    try {
      output.files.push_back({target, writer->write(item, format)});
    } catch (const ConversionError &e) {
      output.errors.push_back(
          {ErrorKind::Conversion, source, format + ": " + e.reason()});
    }
  }

  return output;
}

SiteBuilder::RenderOutput
SiteBuilder::render_listing(const ListingPage &listing) const {
  RenderOutput output;
  try {
    RenderContext context = make_context(listing.page);
    context.paginator = listing.paginator;
    output.files.push_back(
        {listing.output_path, renderer->render(listing.template_id, context)});
    output.rendered = true;
  } catch (const RenderError &e) {
    output.errors.push_back(BuildError::from(e));
  }
  return output;
}

void SiteBuilder::write_file(const fs::path &relative,
                             const std::string &data) const {
  const fs::path path = output_dir / relative;

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw WriteError(path.string(), ec.message());
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw WriteError(path.string(), "cannot open file for writing");
  }
  file << data;
  file.close();
  if (!file) {
    throw WriteError(path.string(), "write failed");
  }
}

int SiteBuilder::copy_static_files() const {
  const fs::path static_dir = project_root / config.static_dir;
  if (!fs::is_directory(static_dir)) {
    return 0;
  }

  const fs::path static_out = output_dir / "static";
  int count = 0;
  std::error_code ec;

  for (fs::recursive_directory_iterator it(static_dir, ec), end;
       it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!it->is_regular_file()) {
      continue;
    }

    const fs::path relative = fs::relative(it->path(), static_dir);
    const fs::path out_path = static_out / relative;

    fs::create_directories(out_path.parent_path(), ec);
    if (!ec) {
      fs::copy_file(it->path(), out_path, fs::copy_options::overwrite_existing,
                    ec);
    }
    if (ec) {
      throw WriteError(out_path.string(), ec.message());
    }

    ++count;
    log_processed(relative.generic_string(), true);
  }

  if (ec) {
    throw WriteError(static_dir.string(), ec.message());
  }
  return count;
}

BuildResult SiteBuilder::build() {
  const auto start = std::chrono::steady_clock::now();
  BuildResult result;

  auto finish = [&]() -> BuildResult {
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.items_failed = result.items_total - result.items_rendered;
    LOG_INFO << "Build finished in " << result.duration.count() << " ms: "
             << result.items_rendered << "/" << result.items_total
             << " items, " << result.errors.size() << " errors";
    return result;
  };

  if (!options.quiet) {
    std::cout << "\n"
              << termcolor::bright_cyan
              << "╔═══════════════════════════════════════════╗\n"
              << "║        🚀 Building Static Site            ║\n"
              << "╚═══════════════════════════════════════════╝"
              << termcolor::reset << "\n";
  }

  try {
    config = SiteConfig::load(project_root);
    output_dir = guarded_output_dir(project_root, config);
    converter = MarkupConverter::create(config.converter);
    writer = std::make_unique<FormatWriter>(*converter,
                                            config.converter.from_format);
  } catch (const ConfigError &e) {
    LOG_ERROR << "Configuration error: " << e.what();
    result.add_error(e);
    result.success = false;
    return finish();
  }

  result.output_dir = output_dir;
  build_id = BuildInfo::getInstance().generate_build_id(
      {config.source, project_root / config.content_dir,
       project_root / config.templates_dir, project_root / config.static_dir});
  const fs::path templates_dir = project_root / config.templates_dir;
  resolver = std::make_unique<TemplateResolver>(templates_dir,
                                                config.default_layout);
  renderer = std::make_unique<Renderer>(templates_dir);

  // Load
  LoadResult loaded = ContentLoader::load(project_root / config.content_dir,
                                          {options.include_drafts});
  for (const auto &e : loaded.errors) {
    result.add_error(e);
    log_processed(e.path(), false, e.reason());
  }
  result.drafts = std::move(loaded.drafts);
  items = std::move(loaded.items);
  result.items_total = static_cast<int>(items.size() + loaded.errors.size());

  drop_duplicate_outputs(result);

  // Convert
  LOG_DEBUG << "Converting " << items.size() << " items on " << thread_count()
            << " threads with " << converter->name();
  convert_all(result);
  resolve_layouts(result);

  build_aggregates();
  const auto listings = listing_pages();

  // Render
  if (!options.quiet) {
    std::cout << "\n"
              << termcolor::bright_cyan << "🔨 Building pages"
              << termcolor::reset << "\n";
  }

  std::vector<RenderOutput> outputs(items.size() + listings.size());
  run_parallel(outputs.size(), thread_count(), [&](size_t i) {
    try {
      outputs[i] = i < items.size()
                       ? render_item(items[i])
                       : render_listing(listings[i - items.size()]);
    } catch (const std::exception &e) {
      const std::string label =
          i < items.size()
              ? items[i].source_path.generic_string()
              : listings[i - items.size()].output_path.generic_string();
      outputs[i].errors.push_back({ErrorKind::Render, label, e.what()});
    }
  });

  // Write
  try {
    std::error_code ec;
    fs::remove_all(output_dir, ec);
    if (ec) {
      throw WriteError(output_dir.string(), ec.message());
    }
    fs::create_directories(output_dir, ec);
    if (ec) {
      throw WriteError(output_dir.string(), ec.message());
    }

    for (size_t i = 0; i < outputs.size(); ++i) {
      const auto &output = outputs[i];
      const bool is_item = i < items.size();
      const std::string label =
          is_item ? items[i].source_path.generic_string()
                  : listings[i - items.size()].output_path.generic_string();

      for (const auto &e : output.errors) {
        LOG_WARN << to_string(e.kind) << " in " << e.path << ": " << e.message;
        result.errors.push_back(e);
      }

      for (const auto &file : output.files) {
        write_file(file.path, file.data);
      }

      if (output.rendered) {
        if (is_item) {
          ++result.items_rendered;
        } else {
          ++result.listing_pages;
        }
        log_processed(label, true);
      } else {
        log_processed(label, false,
                      output.errors.empty() ? "" : output.errors[0].message);
      }
    }

    if (!options.quiet && fs::is_directory(project_root / config.static_dir)) {
      std::cout << "\n"
                << termcolor::bright_cyan << "📦 Copying static files"
                << termcolor::reset << "\n";
    }
    result.static_files = copy_static_files();
  } catch (const WriteError &e) {
    LOG_ERROR << "Write failed: " << e.what();
    result.add_error(e);
    result.success = false;
    return finish();
  }

  result.success = !(result.items_total > 0 && result.items_rendered == 0) &&
                   !result.has_fatal_error();
  return finish();
}

BuildResult build_site(const fs::path &root, const BuildOptions &options) {
  SiteBuilder builder(root, options);
  BuildResult result = builder.build();
  if (!options.quiet) {
    result.print_summary(std::cout);
  }
  return result;
}
