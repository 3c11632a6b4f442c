#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Single forward pass over the lines that carry one date key.
class DateLineCursor {
public:
    enum class Status { Line, End, DecodeFailure };

    DateLineCursor(std::string_view region, size_t startOffset, std::string targetDate);

    // Line: 'line' holds the next matching line (without its terminator).
    // End: the date changed or the region is exhausted.
    // DecodeFailure: a line with the date key is not valid UTF-8; position()
    // is its start offset. The cursor stays failed.
    Status next(std::string_view& line);

    size_t position() const;

private:
    std::string_view region_;
    size_t position_;
    std::string target_;
    bool done_ = false;
    bool failed_ = false;
};

// Locates the run of lines for one date in a region whose lines are sorted
// by their leading YYYY-MM-DD key. Sortedness is a precondition and is not
// checked; on unsorted input the result is unspecified.
class DateRangeSearcher {
public:
    DateRangeSearcher(std::string_view region, std::string targetDate);

    // Start offset of the first line whose date key equals the target.
    // A midpoint line that is not valid UTF-8 is treated as later than the target.
    std::optional<size_t> findFirstOccurrence();

    DateLineCursor extractForward(size_t startOffset) const;

    // Search steps taken by the last findFirstOccurrence() call.
    size_t stepCount() const;

    const std::string& targetDate() const;

private:
    std::string_view region_;
    std::string target_;
    size_t steps_ = 0;
};
