#pragma once
/*
 * Logging
 *
 * Purpose: install the default spdlog logger writing to <data dir>/oaview.log.
 * The terminal belongs to the TUI, so nothing is ever logged to stdout/stderr;
 * if the file cannot be opened a null sink is used.
 * Env: OAVIEW_DATA overrides the data dir, OAVIEW_LOGLEVEL the level.
 */
#include <filesystem>
#include <optional>
#include <string>

std::optional<std::filesystem::path> data_dir();
// Returns the log file path, or an empty path when logging to the null sink.
std::filesystem::path init_logging(const std::string& level);
