#include "AppConfig.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {

const char* kDefaultConfigFile = "logdate.json";

po::options_description make_options() {
    po::options_description opts("Usage: logdate DATE [options]\n\nExtract the log lines of one YYYY-MM-DD date from a date-sorted log\n\nOptions");
    opts.add_options()
        ("help,h", "show this help")
        ("url,u", po::value<std::string>(), "download the log (or a .zip/.gz holding it) from this URL")
        ("file,f", po::value<std::string>(), "read a local log file (.zip/.gz are unpacked)")
        ("output-dir,d", po::value<std::string>(), "directory for output_<DATE>.txt (default: output)")
        ("output,o", po::value<std::string>(), "explicit output file, '-' for stdout")
        ("config,c", po::value<std::string>(), "JSON config file (default: ./logdate.json if present)")
        ("timeout,t", po::value<double>(), "HTTP timeout in seconds")
        ("log-level,l", po::value<std::string>(), "trace|debug|info|warn|error")
        ("json", "print a JSON run summary on stdout");
    return opts;
}

std::string member_string(const Json::Value& root, const char* key) {
    const Json::Value& v = root[key];
    if (!v.isString()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a string");
    }
    return v.asString();
}

}

std::string AppConfig::resolvedOutputPath() const {
    if (!outputPath.empty()) return outputPath;
    return (std::filesystem::path(outputDir) / ("output_" + date + ".txt")).string();
}

bool is_known_log_level(const std::string& level) {
    static const std::vector<std::string> kLevels = {"trace", "debug", "info", "warn", "error"};
    for (const auto& l : kLevels) {
        if (l == level) return true;
    }
    return false;
}

void apply_config_json(const Json::Value& root, AppConfig& cfg) {
    if (!root.isObject()) {
        throw ConfigError("Config root must be a JSON object");
    }
    if (root.isMember("source_url")) cfg.sourceUrl = member_string(root, "source_url");
    if (root.isMember("output_dir")) cfg.outputDir = member_string(root, "output_dir");
    if (root.isMember("log_level")) {
        cfg.logLevel = member_string(root, "log_level");
        if (!is_known_log_level(cfg.logLevel)) {
            throw ConfigError("Unknown log_level in config: " + cfg.logLevel);
        }
    }
    if (root.isMember("http_timeout_seconds")) {
        const Json::Value& v = root["http_timeout_seconds"];
        if (!v.isNumeric() || v.asDouble() <= 0) {
            throw ConfigError("Config key 'http_timeout_seconds' must be a positive number");
        }
        cfg.httpTimeoutSeconds = v.asDouble();
    }
    if (root.isMember("json_summary")) {
        const Json::Value& v = root["json_summary"];
        if (!v.isBool()) {
            throw ConfigError("Config key 'json_summary' must be a boolean");
        }
        cfg.jsonSummary = v.asBool();
    }
}

void load_config_file(const std::string& path, bool required, AppConfig& cfg) {
    std::ifstream in(path);
    if (!in) {
        if (required) {
            throw ConfigError("Cannot read config file: " + path);
        }
        return;
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw ConfigError("Invalid JSON in " + path + ": " + errs);
    }
    apply_config_json(root, cfg);
    cfg.configPath = path;
}

AppConfig parse_command_line(int argc, const char* const argv[], std::string* usage) {
    po::options_description opts = make_options();
    po::options_description hidden;
    hidden.add_options()("date", po::value<std::string>(), "target date");
    po::options_description all;
    all.add(opts).add(hidden);
    po::positional_options_description positional;
    positional.add("date", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    AppConfig cfg;
    if (vm.count("help")) {
        cfg.showHelp = true;
        if (usage) {
            std::ostringstream os;
            os << opts;
            *usage = os.str();
        }
        return cfg;
    }

    if (vm.count("config")) {
        load_config_file(vm["config"].as<std::string>(), true, cfg);
    } else {
        load_config_file(kDefaultConfigFile, false, cfg);
    }

    if (!vm.count("date")) {
        throw ConfigError("Missing DATE argument (YYYY-MM-DD)");
    }
    cfg.date = vm["date"].as<std::string>();

    if (vm.count("url") && vm.count("file")) {
        throw ConfigError("--url and --file are mutually exclusive");
    }
    if (vm.count("url")) {
        cfg.sourceUrl = vm["url"].as<std::string>();
        cfg.sourceFile.clear();
    }
    if (vm.count("file")) {
        cfg.sourceFile = vm["file"].as<std::string>();
        cfg.sourceUrl.clear();
    }
    if (cfg.sourceUrl.empty() && cfg.sourceFile.empty()) {
        throw ConfigError("No log source: pass --url or --file (or set source_url in the config)");
    }
    if (vm.count("output-dir")) cfg.outputDir = vm["output-dir"].as<std::string>();
    if (vm.count("output")) cfg.outputPath = vm["output"].as<std::string>();
    if (vm.count("timeout")) {
        cfg.httpTimeoutSeconds = vm["timeout"].as<double>();
        if (cfg.httpTimeoutSeconds <= 0) {
            throw ConfigError("--timeout must be positive");
        }
    }
    if (vm.count("log-level")) {
        cfg.logLevel = vm["log-level"].as<std::string>();
        if (!is_known_log_level(cfg.logLevel)) {
            throw ConfigError("Unknown --log-level: " + cfg.logLevel);
        }
    }
    if (vm.count("json")) cfg.jsonSummary = true;
    return cfg;
}
