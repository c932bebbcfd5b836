#include "config.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void test_defaults() {
  Config c;
  assert(c.settings().mouse);
  assert(c.settings().tick_ms == 250);
  assert(c.settings().theme == "solarized-dark");
  assert(c.settings().log_level == "info");
}

static void test_set_commands() {
  Config c;
  std::string msg;
  assert(c.execute("set tick 100", msg));
  assert(c.settings().tick_ms == 100);
  assert(msg == "tick 100ms");
  assert(c.execute("set tick=40", msg));
  assert(c.settings().tick_ms == 40);
  assert(!c.execute("set tick 5", msg));
  assert(msg.find(">= 16") != std::string::npos);
  assert(!c.execute("set tick abc", msg));
  assert(c.settings().tick_ms == 40);

  assert(c.execute("set mouse off", msg));
  assert(!c.settings().mouse);
  assert(c.execute("set mouse", msg));
  assert(c.settings().mouse);
  assert(!c.execute("set mouse maybe", msg));

  assert(c.execute("set theme mono", msg));
  assert(c.settings().theme == "mono");
  assert(c.execute("set theme=solarized", msg));
  assert(c.settings().theme == "solarized-dark");
  assert(!c.execute("set theme neon", msg));

  assert(c.execute("set loglevel debug", msg));
  assert(c.settings().log_level == "debug");
  assert(!c.execute("set loglevel loud", msg));
  assert(c.settings().log_level == "debug");
}

static void test_unknown_commands() {
  Config c;
  std::string msg;
  assert(!c.execute("bogus", msg));
  assert(msg == "unknown command: bogus");
  assert(!c.execute("set wobble on", msg));
  assert(msg == "unknown command: set wobble");
}

static void test_load_file() {
  auto path = std::filesystem::temp_directory_path() / "oaview_test_rc";
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "\" vim style comment\n"
        << "// c style comment\n"
        << "\n"
        << ":set tick 64\r\n"
        << "  set theme mono\n"
        << "set wobble on\n"
        << "set tick 3\n";
  }
  Config c;
  std::vector<std::string> messages;
  c.load_file(path, messages);
  assert(c.settings().tick_ms == 64);
  assert(c.settings().theme == "mono");
  assert(messages.size() == 2);
  assert(messages[0] == path.string() + ":7: unknown command: set wobble");
  assert(messages[1].rfind(path.string() + ":8: set tick:", 0) == 0);
  std::filesystem::remove(path);

  std::vector<std::string> none;
  c.load_file(path, none);
  assert(none.empty());
}

static void test_default_path() {
  setenv("OAVIEW_CONFIG", "/tmp/custom_oaviewrc", 1);
  auto p = Config::default_path();
  assert(p && *p == std::filesystem::path("/tmp/custom_oaviewrc"));
  unsetenv("OAVIEW_CONFIG");
  setenv("HOME", "/home/someone", 1);
  p = Config::default_path();
  assert(p && *p == std::filesystem::path("/home/someone/.oaviewrc"));
}

int main() {
  test_defaults();
  test_set_commands();
  test_unknown_commands();
  test_load_file();
  test_default_path();
  return 0;
}
