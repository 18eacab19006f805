#pragma once

#include <chrono>
#include <map>
#include <string>
#include "core/errors/toolhub_errors.hpp"

namespace toolhub::transport::http_client {

struct Url {
    std::string scheme = "http";
    std::string host;
    std::string port = "80";
    std::string base_path;  // without trailing slash, may be empty

    // base_path + path, e.g. "/api" + "/jsonrpc".
    std::string target(const std::string& path) const;
    std::string to_string() const;
};

// Accepts http://host[:port][/path]. https is rejected.
core::errors::Result<Url> parse_url(const std::string& text);

struct Response {
    int status = 0;
    std::string body;
    std::string content_type;
};

using Headers = std::map<std::string, std::string>;

// One request over a fresh connection; the whole exchange shares `timeout`.
// Connect/IO failures are Transport errors, expiry is a RequestTimeout.
core::errors::Result<Response> post_json(const Url& url, const std::string& path,
                                         const std::string& body, const Headers& headers,
                                         std::chrono::milliseconds timeout);

core::errors::Result<Response> get(const Url& url, const std::string& path,
                                   const Headers& headers, std::chrono::milliseconds timeout);

}  // namespace toolhub::transport::http_client
