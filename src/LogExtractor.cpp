#include "LogExtractor.hpp"
#include "DateRangeSearcher.hpp"
#include "MappedLogFile.hpp"
#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>
#include <trantor/utils/Logger.h>

LineSink LineSink::toFile(std::string path) {
    LineSink sink;
    sink.label_ = path;
    sink.path_ = std::move(path);
    return sink;
}

LineSink LineSink::toStream(std::ostream& out, std::string label) {
    LineSink sink;
    sink.label_ = std::move(label);
    sink.out_ = &out;
    return sink;
}

std::ostream& LineSink::stream() {
    if (out_) return *out_;

    std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw OutputError("Cannot create output directory " + target.parent_path().string() + ": " + ec.message());
        }
    }
    file_ = std::make_unique<std::ofstream>(path_, std::ios::binary | std::ios::trunc);
    if (!*file_) {
        throw OutputError("Cannot open output file: " + path_);
    }
    out_ = file_.get();
    return *out_;
}

void LineSink::write(const char* data, size_t len) {
    std::ostream& os = stream();
    os.write(data, static_cast<std::streamsize>(len));
    os.put('\n');
    if (!os) {
        throw OutputError("Write failed: " + label_);
    }
}

void LineSink::flush() {
    if (!out_) return;
    out_->flush();
    if (!*out_) {
        throw OutputError("Flush failed: " + label_);
    }
}

bool LineSink::opened() const {
    return out_ != nullptr;
}

const std::string& LineSink::label() const {
    return label_;
}

const char* to_string(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::Found: return "found";
        case ExtractionStatus::NotFound: return "not_found";
        case ExtractionStatus::DecodeFailure: return "decode_failure";
    }
    return "unknown";
}

ExtractionResult extract_date(const std::string& logPath, const std::string& targetDate, LineSink& sink) {
    ExtractionResult result;
    MappedLogFile log(logPath);
    result.fileSize = log.size();
    LOG_DEBUG << "Mapped " << logPath << " (" << log.size() << " bytes)";

    DateRangeSearcher searcher(log.view(), targetDate);
    auto first = searcher.findFirstOccurrence();
    result.steps = searcher.stepCount();
    if (!first) {
        LOG_INFO << "No logs found for date " << targetDate << " after " << result.steps << " search steps";
        result.status = ExtractionStatus::NotFound;
        return result;
    }
    result.firstOffset = *first;
    LOG_DEBUG << "First line for " << targetDate << " at offset " << *first << " (" << result.steps << " steps)";

    DateLineCursor cursor = searcher.extractForward(*first);
    std::string_view line;
    DateLineCursor::Status st;
    while ((st = cursor.next(line)) == DateLineCursor::Status::Line) {
        sink.write(line.data(), line.size());
        ++result.linesWritten;
        result.bytesWritten += line.size() + 1;
    }
    sink.flush();

    if (st == DateLineCursor::Status::DecodeFailure) {
        result.status = ExtractionStatus::DecodeFailure;
        result.failureOffset = cursor.position();
        LOG_ERROR << "Line at offset " << result.failureOffset << " is not valid UTF-8; "
                  << result.linesWritten << " lines already written to " << sink.label();
        return result;
    }

    result.status = ExtractionStatus::Found;
    LOG_INFO << "Wrote " << result.linesWritten << " lines for " << targetDate << " to " << sink.label();
    return result;
}
