#pragma once
/*
 * TextWrapper
 *
 * Purpose: wrap styled runs into lines no wider than `width` cells.
 * Rules: '\n' always ends the current line (blank lines survive); a run that
 *        overflows is cut at the width boundary and continues on the next line.
 * Note: run boundaries and styles are preserved; width < 1 is treated as 1.
 */
#include <string>
#include <vector>
#include "style.hpp"

std::vector<StyledLine> wrap(const std::vector<StyledRun>& runs, int width);
std::vector<StyledLine> wrap_text(const std::string& text, int width, const Style& style = {});
