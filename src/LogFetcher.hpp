#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string path = "/";
    std::string query;

    // "scheme://host[:port]", the form HttpClient expects
    std::string origin() const;
    // last non-empty path segment, or "" for a bare host
    std::string fileName() const;
};

std::optional<ParsedUrl> parse_url(const std::string& url);

// Request line target: the path plus the raw query, byte for byte.
std::string request_target(const ParsedUrl& url);

// Value for a Range header covering [first, last].
std::string range_header(uint64_t first, uint64_t last);

// Total length announced by a Content-Range header; nullopt when unknown.
std::optional<uint64_t> parse_content_range_total(const std::string& header);

// Resolves a Location header against the URL it came from.
std::string resolve_redirect(const ParsedUrl& base, const std::string& location);

// Blocking HTTP(S) fetches driven by a private event loop thread.
class LogFetcher {
public:
    explicit LogFetcher(double timeoutSeconds = 300.0, int maxRedirects = 5, uint64_t pieceBytes = 8 * 1024 * 1024);
    ~LogFetcher();
    LogFetcher(const LogFetcher&) = delete;
    LogFetcher& operator=(const LogFetcher&) = delete;

    // HEAD request; true only for a final 200 answer.
    bool isReachable(const std::string& url);

    // GET the URL into 'directory' in ranged pieces of at most pieceBytes;
    // returns the written file.
    std::filesystem::path download(const std::string& url, const std::filesystem::path& directory);

private:
    drogon::HttpResponsePtr send(const std::string& url, drogon::HttpMethod method, std::string* finalUrl,
                                 const std::string& range = std::string());

    std::unique_ptr<trantor::EventLoopThread> loopThread_;
    double timeout_;
    int maxRedirects_;
    uint64_t pieceBytes_;
};
