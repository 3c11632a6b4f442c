#pragma once
#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

class OutputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Destination for extracted lines. A file sink creates its parent directory
// and the file itself only when the first line arrives, so a run without
// matches leaves nothing behind.
class LineSink {
public:
    static LineSink toFile(std::string path);
    static LineSink toStream(std::ostream& out, std::string label);

    void write(const char* data, size_t len);
    void flush();
    bool opened() const;
    const std::string& label() const;

private:
    LineSink() = default;
    std::ostream& stream();

    std::string label_;
    std::string path_;
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_ = nullptr;
};

enum class ExtractionStatus { Found, NotFound, DecodeFailure };

const char* to_string(ExtractionStatus status);

struct ExtractionResult {
    ExtractionStatus status = ExtractionStatus::NotFound;
    uint64_t fileSize = 0;
    uint64_t firstOffset = 0;
    uint64_t linesWritten = 0;
    uint64_t bytesWritten = 0;
    uint64_t failureOffset = 0;
    size_t steps = 0;
};

// One extraction run over a local, date-sorted log file. The file is mapped
// for the duration of the call only. Mapping and output failures throw;
// NotFound and DecodeFailure are reported through the result.
ExtractionResult extract_date(const std::string& logPath, const std::string& targetDate, LineSink& sink);
