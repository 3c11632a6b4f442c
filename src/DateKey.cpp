#include "DateKey.hpp"

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int two_digits(std::string_view s, size_t at) {
    return (s[at] - '0') * 10 + (s[at + 1] - '0');
}

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

}

bool is_valid_date_key(std::string_view s) {
    if (s.size() != kDateKeyLength) return false;
    for (size_t i = 0; i < kDateKeyLength; ++i) {
        if (i == 4 || i == 7) {
            if (s[i] != '-') return false;
        } else if (!is_digit(s[i])) {
            return false;
        }
    }
    int year = two_digits(s, 0) * 100 + two_digits(s, 2);
    int month = two_digits(s, 5);
    int day = two_digits(s, 8);
    if (month < 1 || month > 12 || day < 1) return false;

    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int last = kDaysInMonth[month - 1];
    if (month == 2 && is_leap_year(year)) last = 29;
    return day <= last;
}

int compare_date_key(std::string_view line, std::string_view target) {
    return line.substr(0, kDateKeyLength).compare(target);
}

bool has_date_prefix(std::string_view line, std::string_view target) {
    return line.size() >= target.size() && line.compare(0, target.size(), target) == 0;
}
