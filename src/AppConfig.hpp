#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <json/json.h>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string date;
    std::string sourceUrl;
    std::string sourceFile;
    std::string outputDir = "output";
    std::string outputPath;          // overrides outputDir; "-" is stdout
    std::string configPath;
    double httpTimeoutSeconds = 300.0;
    std::string logLevel = "info";
    bool jsonSummary = false;
    bool showHelp = false;

    std::string resolvedOutputPath() const;
};

// Applies the keys present in a parsed config document.
void apply_config_json(const Json::Value& root, AppConfig& cfg);

// Reads a JSON config file; 'required' turns a missing file into an error.
void load_config_file(const std::string& path, bool required, AppConfig& cfg);

// Defaults, then the config file (--config or ./logdate.json), then the
// command line. Help text goes to 'usage' when requested.
AppConfig parse_command_line(int argc, const char* const argv[], std::string* usage);

bool is_known_log_level(const std::string& level);
