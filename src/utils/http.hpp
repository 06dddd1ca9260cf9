#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "httplib.h"

namespace kiln::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;  // without trailing slash

    std::string SchemeHostPort() const;
};

ParsedUrl ParseUrl(const std::string& url);

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port);

struct HttpClientOptions {
    std::chrono::seconds connection_timeout{30};
    std::chrono::seconds read_timeout{120};
    bool use_proxy = false;
};

// Client for the scheme/host/port of `url`; requests must prefix base_path.
std::unique_ptr<httplib::Client> MakeHttpClient(const ParsedUrl& url, const HttpClientOptions& options);

// "request failed (httplib error=N, text)" or "HTTP <status>: <body prefix>".
std::string DescribeFailure(const httplib::Result& result);

// Percent-encodes a query parameter value.
std::string UrlEncode(const std::string& value);

}  // namespace kiln::utils
