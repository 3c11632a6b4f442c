#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include "AppConfig.hpp"
#include "ArchiveExtractor.hpp"
#include "DateKey.hpp"
#include "LogExtractor.hpp"
#include "LogFetcher.hpp"
#include "ScratchDirectory.hpp"

namespace {

// stdout may carry extracted lines, so the logger writes to stderr
void setupLogging(const std::string& level) {
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { std::cerr.write(msg, static_cast<std::streamsize>(len)); },
        []() { std::cerr.flush(); });

    trantor::Logger::LogLevel lvl = trantor::Logger::kInfo;
    if (level == "trace") lvl = trantor::Logger::kTrace;
    else if (level == "debug") lvl = trantor::Logger::kDebug;
    else if (level == "warn") lvl = trantor::Logger::kWarn;
    else if (level == "error") lvl = trantor::Logger::kError;
    trantor::Logger::setLogLevel(lvl);
}

ExtractionResult runExtraction(const AppConfig& cfg, Json::Value& summary) {
    std::optional<ScratchDirectory> scratch;
    std::filesystem::path source;

    if (!cfg.sourceUrl.empty()) {
        summary["source"] = cfg.sourceUrl;
        LogFetcher fetcher(cfg.httpTimeoutSeconds);
        if (!fetcher.isReachable(cfg.sourceUrl)) {
            throw FetchError("Invalid or inaccessible URL: " + cfg.sourceUrl);
        }
        scratch.emplace();
        LOG_INFO << "Downloading " << cfg.sourceUrl;
        source = fetcher.download(cfg.sourceUrl, scratch->subdirectory("download"));
    } else {
        summary["source"] = cfg.sourceFile;
        source = cfg.sourceFile;
    }

    std::filesystem::path logPath = source;
    if (detect_archive(source) != ArchiveKind::Plain) {
        if (!scratch) scratch.emplace();
        logPath = materialize_log(source, scratch->subdirectory("unpacked"));
    }

    std::string outputPath = cfg.resolvedOutputPath();
    LineSink sink = outputPath == "-" ? LineSink::toStream(std::cout, "<stdout>") : LineSink::toFile(outputPath);

    LOG_INFO << "Processing logs for date " << cfg.date << "...";
    ExtractionResult result = extract_date(logPath.string(), cfg.date, sink);
    if (sink.opened()) {
        summary["output"] = sink.label();
    }
    return result;
}

void printSummary(const AppConfig& cfg, const Json::Value& summary) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::ostream& os = cfg.resolvedOutputPath() == "-" ? std::cerr : std::cout;
    os << Json::writeString(writer, summary) << std::endl;
}

}

int main(int argc, char* argv[]) {
    AppConfig cfg;
    std::string usage;
    try {
        cfg = parse_command_line(argc, argv, &usage);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (cfg.showHelp) {
        std::cout << usage << std::endl;
        return 0;
    }
    setupLogging(cfg.logLevel);
    if (!cfg.configPath.empty()) {
        LOG_DEBUG << "Loaded config " << cfg.configPath;
    }

    if (!is_valid_date_key(cfg.date)) {
        std::cerr << "Error: Invalid date format. Please use YYYY-MM-DD" << std::endl;
        return 1;
    }

    Json::Value summary(Json::objectValue);
    summary["date"] = cfg.date;
    int rc = 0;
    try {
        ExtractionResult result = runExtraction(cfg, summary);
        summary["status"] = to_string(result.status);
        summary["lines"] = (Json::Value::UInt64)result.linesWritten;
        summary["bytes"] = (Json::Value::UInt64)result.bytesWritten;
        summary["file_size"] = (Json::Value::UInt64)result.fileSize;
        summary["steps"] = (Json::Value::UInt64)result.steps;
        switch (result.status) {
            case ExtractionStatus::Found:
                std::cerr << "Logs extracted successfully to " << summary["output"].asString() << std::endl;
                break;
            case ExtractionStatus::NotFound:
                std::cerr << "No logs found for date " << cfg.date << std::endl;
                break;
            case ExtractionStatus::DecodeFailure:
                summary["error"]["code"] = "decode_failure";
                summary["error"]["message"] = "Line at offset " + std::to_string(result.failureOffset) + " is not valid UTF-8";
                summary["error"]["offset"] = (Json::Value::UInt64)result.failureOffset;
                std::cerr << "Error: " << summary["error"]["message"].asString() << std::endl;
                rc = 3;
                break;
        }
    } catch (const std::exception& e) {
        summary["status"] = "error";
        summary["error"]["code"] = "run_failed";
        summary["error"]["message"] = e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    }

    if (cfg.jsonSummary) {
        printSummary(cfg, summary);
    }
    return rc;
}
