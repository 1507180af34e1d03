#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/// Largest request (head and body) the local API reads.
constexpr std::size_t kMaxRequestBytes = 64 * 1024;

struct HttpRequest {
    std::string method;
    std::string target;   // as sent, including any query
    std::string path;     // target without the query
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string body;

    [[nodiscard]] std::string header(const std::string& name) const;
};

struct HttpResponse {
    int         status = 200;
    std::string body;
    std::string content_type = "application/json";
};

/// Parses the request line and headers, i.e. everything before the blank
/// line. Returns nullopt for anything that is not HTTP/1.x.
std::optional<HttpRequest> parse_request_head(const std::string& head);

/// Value of Content-Length; 0 when absent, nullopt when unparseable.
std::optional<std::size_t> content_length(const HttpRequest& request);

std::string serialize(const HttpResponse& response);

const char* reason_phrase(int status);

HttpResponse json_response(int status, const nlohmann::json& body);
HttpResponse error_response(int status, const std::string& message);
