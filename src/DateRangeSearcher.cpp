#include "DateRangeSearcher.hpp"
#include "DateKey.hpp"
#include "LineUtils.hpp"
#include <utility>

DateLineCursor::DateLineCursor(std::string_view region, size_t startOffset, std::string targetDate)
    : region_(region),
      position_(startOffset),
      target_(std::move(targetDate)) {}

DateLineCursor::Status DateLineCursor::next(std::string_view& line) {
    if (failed_) return Status::DecodeFailure;
    if (done_ || position_ >= region_.size()) {
        done_ = true;
        return Status::End;
    }

    size_t start = 0, end = 0;
    resolve_line(region_.data(), region_.size(), position_, start, end);
    std::string_view content = region_.substr(start, end - start);

    if (!has_date_prefix(content, target_)) {
        done_ = true;
        return Status::End;
    }
    if (!is_valid_utf8(content.data(), content.size())) {
        position_ = start;
        failed_ = true;
        return Status::DecodeFailure;
    }

    line = content;
    // step over the terminator; a final line without one ends the region
    position_ = end + 1;
    return Status::Line;
}

size_t DateLineCursor::position() const {
    return position_;
}

DateRangeSearcher::DateRangeSearcher(std::string_view region, std::string targetDate)
    : region_(region),
      target_(std::move(targetDate)) {}

std::optional<size_t> DateRangeSearcher::findFirstOccurrence() {
    steps_ = 0;
    std::optional<size_t> first;
    size_t left = 0;
    size_t right = region_.size();

    while (left < right) {
        size_t mid = left + (right - left) / 2;
        ++steps_;

        size_t start = 0, end = 0;
        resolve_line(region_.data(), region_.size(), mid, start, end);
        std::string_view line = region_.substr(start, end - start);

        if (!is_valid_utf8(line.data(), line.size())) {
            right = mid;
            continue;
        }

        int order = compare_date_key(line, target_);
        if (order == 0) {
            // keep narrowing left: the first matching midpoint is rarely the first line
            first = start;
            right = mid;
        } else if (order < 0) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }
    return first;
}

DateLineCursor DateRangeSearcher::extractForward(size_t startOffset) const {
    return DateLineCursor(region_, startOffset, target_);
}

size_t DateRangeSearcher::stepCount() const {
    return steps_;
}

const std::string& DateRangeSearcher::targetDate() const {
    return target_;
}
