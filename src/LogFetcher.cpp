#include "LogFetcher.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <string_view>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/utils/Logger.h>

namespace {

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

std::string ParsedUrl::origin() const {
    std::string s = scheme + "://" + host;
    if (port != 0) {
        s += ":" + std::to_string(port);
    }
    return s;
}

std::string ParsedUrl::fileName() const {
    std::string p = path;
    while (!p.empty() && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::optional<ParsedUrl> parse_url(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos) return std::nullopt;

    ParsedUrl u;
    u.scheme = lowercase(url.substr(0, sep));
    if (u.scheme != "http" && u.scheme != "https") return std::nullopt;

    std::string rest = url.substr(sep + 3);
    // fragments never reach the server
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);

    auto pathStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathStart);
    std::string target = pathStart == std::string::npos ? std::string() : rest.substr(pathStart);
    if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        unsigned long port = std::stoul(portText);
        if (port == 0 || port > 65535) return std::nullopt;
        u.port = static_cast<uint16_t>(port);
        authority.resize(colon);
    }
    if (authority.empty()) return std::nullopt;
    u.host = lowercase(authority);

    auto q = target.find('?');
    if (q != std::string::npos) {
        u.query = target.substr(q + 1);
        target.resize(q);
    }
    u.path = target.empty() ? "/" : target;
    return u;
}

std::string resolve_redirect(const ParsedUrl& base, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;
    if (location.rfind("//", 0) == 0) return base.scheme + ":" + location;
    if (!location.empty() && location[0] == '/') return base.origin() + location;
    std::string dir = base.path.substr(0, base.path.rfind('/') + 1);
    return base.origin() + dir + location;
}

std::string request_target(const ParsedUrl& url) {
    return url.query.empty() ? url.path : url.path + "?" + url.query;
}

std::string range_header(uint64_t first, uint64_t last) {
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

std::optional<uint64_t> parse_content_range_total(const std::string& header) {
    // "bytes 0-1023/4096" or "bytes */4096"
    if (lowercase(header.substr(0, 6)) != "bytes ") return std::nullopt;
    auto slash = header.rfind('/');
    if (slash == std::string::npos || slash + 1 >= header.size()) return std::nullopt;
    std::string total = header.substr(slash + 1);
    if (total.size() > 19 ||
        !std::all_of(total.begin(), total.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoull(total);
}

LogFetcher::LogFetcher(double timeoutSeconds, int maxRedirects, uint64_t pieceBytes)
    : loopThread_(std::make_unique<trantor::EventLoopThread>("logdate-fetch")),
      timeout_(timeoutSeconds),
      maxRedirects_(maxRedirects),
      pieceBytes_(pieceBytes == 0 ? 1 : pieceBytes) {
    loopThread_->run();
}

LogFetcher::~LogFetcher() = default;

drogon::HttpResponsePtr LogFetcher::send(const std::string& url, drogon::HttpMethod method, std::string* finalUrl,
                                         const std::string& range) {
    std::string current = url;
    for (int hop = 0; hop <= maxRedirects_; ++hop) {
        auto parsed = parse_url(current);
        if (!parsed) {
            throw FetchError("Unsupported URL: " + current);
        }
        auto client = drogon::HttpClient::newHttpClient(parsed->origin(), loopThread_->getLoop());
        client->setUserAgent("logdate/1.0");

        auto req = drogon::HttpRequest::newHttpRequest();
        req->setMethod(method);
        // signed URLs depend on the exact query bytes, so the target goes out as given
        req->setPathEncode(false);
        req->setPath(request_target(*parsed));
        if (!range.empty()) {
            req->addHeader("Range", range);
        }

        LOG_DEBUG << (method == drogon::Head ? "HEAD " : "GET ") << current << (range.empty() ? "" : " ") << range;
        auto [result, resp] = client->sendRequest(req, timeout_);
        if (result != drogon::ReqResult::Ok || !resp) {
            throw FetchError("Request to " + parsed->origin() + " failed: " + drogon::to_string(result));
        }

        int status = static_cast<int>(resp->getStatusCode());
        if (is_redirect(status)) {
            const std::string& location = resp->getHeader("location");
            if (location.empty()) {
                throw FetchError("Redirect without Location from " + current);
            }
            current = resolve_redirect(*parsed, location);
            LOG_DEBUG << "Redirected (" << status << ") to " << current;
            continue;
        }
        if (finalUrl) *finalUrl = current;
        return resp;
    }
    throw FetchError("Too many redirects starting at " + url);
}

bool LogFetcher::isReachable(const std::string& url) {
    try {
        auto resp = send(url, drogon::Head, nullptr);
        return static_cast<int>(resp->getStatusCode()) == 200;
    } catch (const FetchError& e) {
        LOG_WARN << e.what();
        return false;
    }
}

std::filesystem::path LogFetcher::download(const std::string& url, const std::filesystem::path& directory) {
    // The body is fetched in ranged pieces so at most one piece is held in
    // memory; servers without range support answer 200 with the whole body.
    std::string finalUrl;
    auto resp = send(url, drogon::Get, &finalUrl, range_header(0, pieceBytes_ - 1));
    int status = static_cast<int>(resp->getStatusCode());
    std::optional<uint64_t> total;
    if (status == 206 || status == 416) {
        total = parse_content_range_total(resp->getHeader("content-range"));
        if (!total) {
            throw FetchError("Missing or invalid Content-Range from " + finalUrl);
        }
    }
    if (status == 416 && *total != 0) {
        throw FetchError("Server rejected range request for " + finalUrl);
    }
    if (status != 200 && status != 206 && status != 416) {
        throw FetchError("Download of " + url + " failed with HTTP status " + std::to_string(status));
    }

    std::string name = parse_url(finalUrl)->fileName();
    if (name.empty() || name == "." || name == "..") {
        name = "logs.zip";
    }
    std::filesystem::path out = directory / name;
    std::ofstream ofs(out, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw FetchError("Cannot create " + out.string());
    }

    uint64_t written = 0;
    auto append = [&](std::string_view body) {
        ofs.write(body.data(), static_cast<std::streamsize>(body.size()));
        if (!ofs) {
            throw FetchError("Write failed: " + out.string());
        }
        written += body.size();
    };

    if (status == 200) {
        append(resp->getBody());
    } else if (status == 206) {
        append(resp->getBody());
        resp.reset();
        while (written < *total) {
            uint64_t last = std::min(*total, written + pieceBytes_) - 1;
            auto piece = send(finalUrl, drogon::Get, nullptr, range_header(written, last));
            if (static_cast<int>(piece->getStatusCode()) != 206) {
                throw FetchError("Range request at offset " + std::to_string(written) + " of " + finalUrl +
                                 " answered HTTP " + std::to_string(static_cast<int>(piece->getStatusCode())));
            }
            auto body = piece->getBody();
            if (body.empty()) {
                throw FetchError("Empty range response at offset " + std::to_string(written) + " of " + finalUrl);
            }
            append(body);
            LOG_DEBUG << "Downloaded " << written << " / " << *total << " bytes";
        }
        if (written != *total) {
            throw FetchError("Download of " + finalUrl + " overran its announced size");
        }
    }

    ofs.close();
    if (!ofs) {
        throw FetchError("Write failed: " + out.string());
    }
    LOG_INFO << "Downloaded " << written << " bytes to " << out.string();
    return out;
}
