#include "LineUtils.hpp"
#include <cstddef>

void resolve_line(const char* data, size_t total_size, size_t position, size_t &line_start, size_t &line_end) {
	if (position > total_size) position = total_size;

	// walk back to the byte after the previous terminator
	size_t start = position;
	while (start > 0 && data[start - 1] != '\n') --start;

	// walk forward to the next terminator (or EOF)
	size_t end = position;
	while (end < total_size && data[end] != '\n') ++end;

	line_start = start;
	line_end = end;
}

bool is_valid_utf8(const char* data, size_t len) {
	const unsigned char* s = reinterpret_cast<const unsigned char*>(data);
	size_t i = 0;
	while (i < len) {
		unsigned char c = s[i];
		if (c < 0x80) {
			++i;
			continue;
		}
		size_t need = 0;
		unsigned char lo = 0x80, hi = 0xBF;
		if (c >= 0xC2 && c <= 0xDF) {
			need = 1;
		} else if (c == 0xE0) {
			need = 2; lo = 0xA0;
		} else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
			need = 2;
		} else if (c == 0xED) {
			need = 2; hi = 0x9F; // UTF-16 surrogates are not scalar values
		} else if (c == 0xF0) {
			need = 3; lo = 0x90;
		} else if (c >= 0xF1 && c <= 0xF3) {
			need = 3;
		} else if (c == 0xF4) {
			need = 3; hi = 0x8F;
		} else {
			return false;
		}
		if (len - i <= need) return false;
		// only the first continuation byte has the narrowed range
		if (s[i + 1] < lo || s[i + 1] > hi) return false;
		for (size_t k = 2; k <= need; ++k) {
			if (s[i + k] < 0x80 || s[i + k] > 0xBF) return false;
		}
		i += need + 1;
	}
	return true;
}
