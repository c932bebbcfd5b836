#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include "app.hpp"
#include "config.hpp"
#include "input.hpp"
#include "logging.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"

static void usage(std::ostream& os) {
  os << "usage: oaview <openapi-file>\n"
     << "  -h, --help     show this help\n"
     << "  -V, --version  show version\n";
}

static int report(const Error& err) {
  spdlog::error("{}: {}", error_kind_name(err.kind), err.message);
  std::cerr << "oaview error: " << error_kind_name(err.kind) << ": " << err.message << "\n";
  return 1;
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  for (int i = 1; i < argc; ++i) {
    if (!std::strcmp(argv[i], "-h") || !std::strcmp(argv[i], "--help")) { usage(std::cout); return 0; }
    if (!std::strcmp(argv[i], "-V") || !std::strcmp(argv[i], "--version")) { std::cout << "oaview " OAVIEW_VERSION "\n"; return 0; }
    path = std::filesystem::path(argv[i]);
  }
  if (!path) { usage(std::cerr); return 2; }

  Config config;
  std::vector<std::string> messages;
  if (auto rc = Config::default_path()) config.load_file(*rc, messages);
  const Settings& settings = config.settings();
  init_logging(settings.log_level);
  spdlog::info("oaview {} starting", OAVIEW_VERSION);
  for (const auto& m : messages) spdlog::warn("{}", m);

  Error err;
  std::shared_ptr<const OpenApiDocument> doc;
  if (!OpenApiDocument::from_file(*path, doc, err)) return report(err);

  App app(doc, theme_by_name(settings.theme).value_or(solarized_dark_theme()));
  if (!messages.empty()) app.set_message(messages.front());
  bool ok = false;
  {
    Terminal term(settings.mouse);
    NcursesTerminal screen;
    Input input(settings.tick_ms);
    ok = app.start(err) && app.run(input, screen, err);
  }
  if (!ok) return report(err);
  spdlog::info("bye");
  return 0;
}
