#include "core/markdown.hpp"
#include "core/output_formats.hpp"
#include "core/site_builder.hpp"
#include "core/template_resolver.hpp"
#include "server/preview_server.hpp"
#include "server/watch_session.hpp"
#include "utils/build_info.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <termcolor/termcolor.hpp>
#include <vector>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace {

constexpr int exit_usage = 2;

void print_usage(const po::options_description &global) {
  std::cout << "quire - a static site generator\n\n";
  std::cout << "Usage: quire [options] <command> [command options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  quire build               Build the site\n";
  std::cout << "  quire serve               Serve the built site locally\n";
  std::cout << "  quire convert <file>      Convert one file to other formats\n";
  std::cout << "  quire doctor              Check the converter and config\n\n";
  std::cout << global << "\n";
  std::cout << "Run 'quire <command> --help' for the options of a command.\n";
}

po::options_description site_options(std::string &site, BuildOptions &build) {
  po::options_description desc("Site options");
  desc.add_options()
      ("site,s", po::value(&site)->default_value(site),
       "Site root directory")
      ("drafts,D", po::bool_switch(&build.include_drafts),
       "Include content marked as draft")
      ("jobs,j", po::value(&build.concurrency)->default_value(0),
       "Worker threads. 0 uses 'concurrency' from the config or all cores")
      ("format,f", po::value(&build.formats)->composing(),
       "Output format (repeatable). Overrides 'output_formats'")
      ("quiet,q", po::bool_switch(&build.quiet),
       "Only print errors and the summary");
  return desc;
}

int cmd_build(const std::vector<std::string> &args) {
  std::string site = ".";
  BuildOptions build;
  bool watch = false;
  int debounce = static_cast<int>(RebuildLoop::default_debounce.count());

  po::options_description desc = site_options(site, build);
  desc.add_options()
      ("help,h", "Print help and exit")
      ("watch,w", po::bool_switch(&watch), "Rebuild when sources change")
      ("debounce", po::value(&debounce)->default_value(debounce),
       "Quiet period in milliseconds before a rebuild");

  po::variables_map vm;
  po::store(po::command_line_parser(args).options(desc).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << "quire build [options]\n" << desc << "\n";
    return 0;
  }
  if (debounce < 0) {
    throw po::validation_error(po::validation_error::invalid_option_value,
                               "debounce");
  }

  if (watch) {
    return run_watch(site, build, std::chrono::milliseconds(debounce));
  }

  BuildResult result = build_site(site, build);
  if (build.quiet) {
    result.print_summary(std::cout);
  }
  return result.exit_code();
}

int cmd_serve(const std::vector<std::string> &args) {
  std::string site = ".";
  ServeOptions serve;
  int debounce = static_cast<int>(serve.debounce.count());

  po::options_description desc = site_options(site, serve.build);
  desc.add_options()
      ("help,h", "Print help and exit")
      ("port,p", po::value(&serve.port)->default_value(serve.port),
       "Port to listen on")
      ("host", po::value(&serve.host)->default_value(serve.host),
       "Address to bind to")
      ("watch,w", po::bool_switch(&serve.watch), "Rebuild when sources change")
      ("debounce", po::value(&debounce)->default_value(debounce),
       "Quiet period in milliseconds before a rebuild");

  po::variables_map vm;
  po::store(po::command_line_parser(args).options(desc).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << "quire serve [options]\n" << desc << "\n";
    return 0;
  }
  if (serve.port <= 0 || serve.port > 65535) {
    throw po::validation_error(po::validation_error::invalid_option_value,
                               "port");
  }
  if (debounce < 0) {
    throw po::validation_error(po::validation_error::invalid_option_value,
                               "debounce");
  }
  serve.debounce = std::chrono::milliseconds(debounce);

  return start_preview_server(site, serve);
}

int cmd_convert(const std::vector<std::string> &args) {
  std::string site = ".";
  std::string input;
  std::string output_dir;
  std::vector<std::string> formats;

  po::options_description desc("Convert options");
  desc.add_options()
      ("help,h", "Print help and exit")
      ("input", po::value(&input), "Markdown file to convert")
      ("format,f", po::value(&formats)->composing(),
       "Output format (repeatable, default html)")
      ("output-dir,o", po::value(&output_dir),
       "Directory for the results. Defaults to the input's directory")
      ("site,s", po::value(&site)->default_value(site),
       "Site root whose config selects the converter");

  po::positional_options_description positional;
  positional.add("input", 1);

  po::variables_map vm;
  po::store(po::command_line_parser(args)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << "quire convert <file> [options]\n" << desc << "\n";
    return 0;
  }
  if (input.empty()) {
    throw po::required_option("input");
  }
  if (formats.empty()) {
    formats.push_back("html");
  }

  std::cout << "Converting " << input << "...\n";
  ConvertResult result =
      convert_file(input, formats, output_dir, SiteConfig::load(site));

  for (const auto &path : result.written) {
    std::cout << termcolor::bright_green << "  → " << termcolor::reset
              << path.string() << "\n";
  }
  for (const auto &e : result.errors) {
    std::cout << termcolor::bright_red << "  ✗ " << termcolor::reset << e.path
              << ": " << e.message << "\n";
  }
  return result.errors.empty() ? 0 : 1;
}

void print_check(bool ok, const std::string &label,
                 const std::string &detail) {
  if (ok) {
    std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset;
  } else {
    std::cout << termcolor::bright_red << "  ✗ " << termcolor::reset;
  }
  std::cout << termcolor::white << label << termcolor::reset;
  if (!detail.empty()) {
    std::cout << termcolor::bright_blue << " " << detail << termcolor::reset;
  }
  std::cout << "\n";
}

int cmd_doctor(const std::vector<std::string> &args) {
  std::string site = ".";

  po::options_description desc("Doctor options");
  desc.add_options()
      ("help,h", "Print help and exit")
      ("site,s", po::value(&site)->default_value(site), "Site root directory");

  po::variables_map vm;
  po::store(po::command_line_parser(args).options(desc).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << "quire doctor [options]\n" << desc << "\n";
    return 0;
  }

  std::cout << "\n"
            << termcolor::bright_cyan << "🩺 Checking " << fs::absolute(site)
            << termcolor::reset << "\n";

  SiteConfig config;
  try {
    config = SiteConfig::load(site);
    SiteBuilder::guarded_output_dir(site, config);
    print_check(true, "config",
                config.source.empty() ? "(defaults)" : config.source.string());
  } catch (const ConfigError &e) {
    print_check(false, "config", e.what());
    return 1;
  }

  bool healthy = true;

  auto converter = MarkupConverter::create(config.converter);
  Availability status = converter->check();
  print_check(status.available, "converter " + converter->name(),
              status.available ? status.version : status.detail);
  healthy = healthy && status.available;

  const fs::path root(site);
  print_check(fs::is_directory(root / config.content_dir), "content",
              (root / config.content_dir).string());

  const fs::path templates_dir = root / config.templates_dir;
  TemplateResolver resolver(templates_dir, config.default_layout);
  const bool has_layout = resolver.has("default") || resolver.has("post") ||
                          resolver.has(config.default_layout);
  print_check(has_layout, "templates",
              std::to_string(resolver.templates().size()) + " in " +
                  templates_dir.string());

  std::cout << "\n";
  return healthy ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string log_level = "info";
  std::string command;

  po::options_description global("General Options");
  global.add_options()
      ("help,h", "Print help and exit")
      ("version,v", "Show version and exit")
      ("log-level,l", po::value(&log_level)->default_value(log_level),
       "Log level; one of 'error', 'warn', 'info', 'debug', 'trace', 'off'");

  po::options_description hidden;
  hidden.add_options()
      ("command", po::value(&command), "command")
      ("args", po::value<std::vector<std::string>>(), "arguments");

  po::options_description all;
  all.add(global).add(hidden);

  po::positional_options_description positional;
  positional.add("command", 1).add("args", -1);

  try {
    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(all)
                                    .positional(positional)
                                    .allow_unregistered()
                                    .run();

    po::variables_map vm;
    po::store(parsed, vm);
    po::notify(vm);

    if (vm.count("version")) {
      std::cout << "quire " << BuildInfo::version() << "\n";
      return 0;
    }

    if (command.empty()) {
      print_usage(global);
      return vm.count("help") ? 0 : exit_usage;
    }

    if (!init_logging(log_level)) {
      std::cerr << "Unknown log level: " << log_level << "\n";
      return exit_usage;
    }

    std::vector<std::string> args =
        po::collect_unrecognized(parsed.options, po::include_positional);
    auto self = std::find(args.begin(), args.end(), command);
    if (self != args.end()) {
      args.erase(self);
    }
    if (vm.count("help")) {
      args.push_back("--help");
    }

    if (command == "build") {
      return cmd_build(args);
    }
    if (command == "serve") {
      return cmd_serve(args);
    }
    if (command == "convert") {
      return cmd_convert(args);
    }
    if (command == "doctor") {
      return cmd_doctor(args);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(global);
    return exit_usage;
  } catch (const po::error &e) {
    std::cerr << termcolor::bright_red << "✗ " << termcolor::reset << e.what()
              << "\n";
    return exit_usage;
  } catch (const std::exception &e) {
    std::cerr << termcolor::bright_red << "✗ Fatal error: " << termcolor::reset
              << e.what() << std::endl;
    return 1;
  }
}
