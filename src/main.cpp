#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "capability.hpp"
#include "page_fetcher.hpp"
#include "viewer.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

struct Options {
  std::optional<RenderMode> mode; // nullopt: detect
  std::string log_path;
  std::string base_url = TV_IMAGE_BASE_URL;
  PageAddress start;
};

const char* kUsage =
    "usage: televideo [--mode auto|iterm2|kitty|sixel|blocks] [--log FILE] [--base-url URL] [PAGE]\n";

bool parse_args(int argc, char** argv, Options& opts, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= argc) { err = "missing value for " + arg; return false; }
      out = argv[++i];
      return true;
    };
    if (arg == "-h" || arg == "--help") { err.clear(); return false; }
    if (arg == "-m" || arg == "--mode") {
      std::string name;
      if (!value(name)) return false;
      if (name == "auto") { opts.mode.reset(); continue; }
      opts.mode = parse_render_mode(name);
      if (!opts.mode) { err = "unknown mode: " + name; return false; }
    } else if (arg == "-l" || arg == "--log") {
      if (!value(opts.log_path)) return false;
    } else if (arg == "--base-url") {
      if (!value(opts.base_url)) return false;
    } else if (!arg.empty() && arg[0] != '-') {
      int page = 0;
      try { page = std::stoi(arg); } catch (const std::exception&) { page = 0; }
      if (!is_valid_page(page)) { err = "page must be between 100-899: " + arg; return false; }
      opts.start = PageAddress{page, std::nullopt};
    } else {
      err = "unknown option: " + arg;
      return false;
    }
  }
  return true;
}

void setup_logging(const std::string& path) {
  std::shared_ptr<spdlog::logger> logger;
  if (path.empty()) {
    logger = spdlog::null_logger_mt("televideo");
  } else {
    logger = spdlog::basic_logger_mt("televideo", path, true);
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::debug);
  }
  spdlog::set_default_logger(logger);
}

} // namespace

int main(int argc, char** argv) {
  Options opts;
  std::string err;
  if (!parse_args(argc, argv, opts, err)) {
    if (!err.empty()) std::cerr << "televideo: " << err << "\n";
    std::cerr << kUsage;
    return err.empty() ? 0 : 2;
  }
  try {
    setup_logging(opts.log_path);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "televideo: cannot open log: " << e.what() << "\n";
    return 2;
  }
  spdlog::info("televideo: start page {}, base {}", format_address(opts.start), opts.base_url);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  curl_global_init(CURL_GLOBAL_DEFAULT);

  // probe before ncurses owns the tty
  RenderMode mode = opts.mode ? *opts.mode : detect_render_mode(system_probe());
  CellGeometry cell = query_cell_geometry();
  spdlog::info("televideo: render mode {}", render_mode_name(mode));

  int rc = 0;
  try {
    Terminal term;
    NcursesTerminal screen;
    HttpPageFetcher fetcher(opts.base_url);
    Viewer viewer(screen, fetcher, mode, cell, opts.start);
    rc = viewer.run(&g_interrupted);
  } catch (const std::exception& e) {
    spdlog::critical("televideo: {}", e.what());
    std::cerr << "televideo: " << e.what() << "\n";
    rc = 1;
  }
  curl_global_cleanup();
  spdlog::shutdown();
  return rc;
}
