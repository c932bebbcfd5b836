#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap, either whole or split into lines (CRLF normalized).
 * Usage: mmap_read_file(path, out, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_read_file(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg);

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
