#pragma once
/*
 * utf8
 *
 * Purpose: codepoint counting/slicing so one codepoint == one terminal cell.
 * Note: malformed bytes count as one cell each; never throws.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

int utf8_length(std::string_view s);
// byte offset just past the first n codepoints (clamped to s.size())
size_t utf8_offset(std::string_view s, int n);
std::vector<std::string> utf8_glyphs(std::string_view s);
// first n cells of s
std::string utf8_prefix(std::string_view s, int n);
// last n cells of s
std::string utf8_suffix(std::string_view s, int n);
