#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "file_reader.hpp"
#include "theme.hpp"

static bool parse_on_off(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

Config::Config() { register_commands(); }

void Config::register_commands() {
  registry_.register_command("set mouse", [this](const std::vector<std::string>& args, std::string& msg){
    bool v = false;
    if (!parse_on_off(args, settings_.mouse, v)) { msg = "set mouse: use set mouse on|off"; return false; }
    settings_.mouse = v;
    msg = v ? "mouse on" : "mouse off";
    return true;
  });
  registry_.register_command("set tick", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set tick: use set tick <ms>"; return false; }
    const std::string& s = args[0];
    bool ok = !s.empty() && s.size() < 7 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { msg = "set tick: value must be a number"; return false; }
    int ms = std::stoi(s);
    if (ms < OAVIEW_MIN_TICK_MS) { msg = "set tick: value must be >= " + std::to_string(OAVIEW_MIN_TICK_MS); return false; }
    settings_.tick_ms = ms;
    msg = "tick " + s + "ms";
    return true;
  });
  registry_.register_command("set theme", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty() || !theme_by_name(args[0])) { msg = "set theme: use set theme solarized-dark|mono"; return false; }
    settings_.theme = theme_by_name(args[0])->name;
    msg = "theme " + settings_.theme;
    return true;
  });
  registry_.register_command("set loglevel", [this](const std::vector<std::string>& args, std::string& msg){
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (args.empty() || std::find(levels.begin(), levels.end(), args[0]) == levels.end()) {
      msg = "set loglevel: use set loglevel trace|debug|info|warn|error|critical|off";
      return false;
    }
    settings_.log_level = args[0];
    msg = "loglevel " + args[0];
    return true;
  });
}

bool Config::execute(const std::string& line, std::string& msg) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return registry_.execute("set " + name, subargs, msg);
  }
  return registry_.execute(cmd, args, msg);
}

void Config::load_file(const std::filesystem::path& path, std::vector<std::string>& messages) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { messages.push_back(msg); return; }
  int line_no = 0;
  for (const std::string& raw : lines) {
    line_no++;
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    if (!execute(s, msg)) messages.push_back(path.string() + ":" + std::to_string(line_no) + ": " + msg);
  }
}

std::optional<std::filesystem::path> Config::default_path() {
  if (const char* p = std::getenv("OAVIEW_CONFIG"); p && *p) return std::filesystem::path(p);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / ".oaviewrc";
}
