/*
 * Line filter for polled output - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <string>

namespace re2 { class RE2; }

namespace toolbox {

// Compile a filter pattern (RE2 syntax). An empty pattern yields nullptr with
// no error. On a bad pattern returns nullptr and fills `error`.
std::unique_ptr<re2::RE2> compile_filter(const std::string& pattern, std::string& error);

// Keep the lines of `text` that the pattern matches in full. A trailing newline
// survives only if at least one line was kept.
std::string filter_lines(const std::string& text, const re2::RE2& re);

} // namespace toolbox
