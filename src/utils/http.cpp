#include "utils/http.hpp"

#include <cctype>
#include <cstdio>

#include "utils/common.hpp"

namespace kiln::utils {
namespace {

constexpr std::size_t kBodyPreview = 256;

}  // namespace

std::string ParsedUrl::SchemeHostPort() const {
    return std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::unique_ptr<httplib::Client> MakeHttpClient(const ParsedUrl& url, const HttpClientOptions& options) {
    auto client = std::make_unique<httplib::Client>(url.SchemeHostPort());
    client->set_connection_timeout(static_cast<time_t>(options.connection_timeout.count()));
    client->set_read_timeout(static_cast<time_t>(options.read_timeout.count()));
    client->set_write_timeout(static_cast<time_t>(options.read_timeout.count()));

    if (options.use_proxy) {
        std::string proxy_host;
        int proxy_port = 0;
        for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
            const auto value = GetEnv(name);
            if (!value.empty() && ParseProxyHostPort(value, proxy_host, proxy_port)) {
                client->set_proxy(proxy_host, proxy_port);
                break;
            }
        }
    }
    return client;
}

std::string DescribeFailure(const httplib::Result& result) {
    if (!result) {
        const auto err = result.error();
        return "request failed (httplib error=" + std::to_string(static_cast<int>(err)) + ", " +
            httplib::to_string(err) + ")";
    }
    auto body = result->body.substr(0, kBodyPreview);
    return "HTTP " + std::to_string(result->status) + (body.empty() ? "" : ": " + body);
}

std::string UrlEncode(const std::string& value) {
    std::string encoded;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
            encoded += buffer;
        }
    }
    return encoded;
}

}  // namespace kiln::utils
