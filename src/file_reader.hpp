#pragma once
/*
 * FileReader
 *
 * Purpose: read a text file via mmap and split it into lines; CRLF is normalized.
 * Usage: read_lines(path, out_lines, msg); returns false with msg on failure.
 */
#include <filesystem>
#include <string>
#include <vector>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);
