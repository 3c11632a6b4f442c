#pragma once
#include <cstddef>

// Resolve the '\n'-delimited line containing 'position' as [line_start, line_end).
// A position on a terminator resolves to the line that ends there; positions past
// total_size are clamped to total_size.
void resolve_line(const char* data, size_t total_size, size_t position, size_t &line_start, size_t &line_end);

// Strict UTF-8 check (no overlongs, no surrogates, nothing above U+10FFFF).
bool is_valid_utf8(const char* data, size_t len);
