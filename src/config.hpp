#pragma once
/*
 * Config
 *
 * Purpose: user settings loaded from ~/.oaviewrc (or $OAVIEW_CONFIG).
 * Format: one command per line ("set tick 100", "set theme=mono"); '#', '"'
 * and '//' start comments; a leading ':' is ignored. Bad lines are reported,
 * never fatal.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"

#define OAVIEW_VERSION "0.3.0"
#define OAVIEW_MIN_TICK_MS 16

struct Settings {
  bool mouse = true;
  int tick_ms = 250;
  std::string theme = "solarized-dark";
  std::string log_level = "info";
};

class Config {
public:
  Config();
  const Settings& settings() const { return settings_; }

  bool execute(const std::string& line, std::string& msg);
  // Appends one message per rejected line ("<file>:<line>: <why>").
  void load_file(const std::filesystem::path& path, std::vector<std::string>& messages);
  static std::optional<std::filesystem::path> default_path();

private:
  void register_commands();
  Settings settings_;
  CommandRegistry registry_;
};
