#pragma once
#include <cstddef>
#include <string_view>

constexpr size_t kDateKeyLength = 10;

// YYYY-MM-DD with a real month and a day that exists in that month.
bool is_valid_date_key(std::string_view s);

// Lexical three-way comparison of a line's leading date key against 'target'.
// Lines shorter than the key compare on what they have.
int compare_date_key(std::string_view line, std::string_view target);

bool has_date_prefix(std::string_view line, std::string_view target);
