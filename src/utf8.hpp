#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: count and slice code points; the TUI treats one code point as one cell.
 */
#include <string>
#include <string_view>
#include <vector>

int utf8_length(std::string_view s);
std::string_view utf8_prefix(std::string_view s, int max_cells);
std::vector<std::string> utf8_split(std::string_view s);
