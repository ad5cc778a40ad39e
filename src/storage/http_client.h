#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace bme {

struct HttpResponse {
    int code{0};
    std::string body;
    std::map<std::string,std::string> headers; // lowercased keys
};

struct HttpRequest {
    std::string method{"GET"};
    std::string host;
    uint16_t    port{80};
    bool        tls{false};
    std::string path{"/"};
    std::string body;
    std::vector<std::pair<std::string,std::string>> headers; // sent as given
    int         timeout_ms{5000};
};

// One blocking HTTP/1.1 round trip (Connection: close). TLS via OpenSSL with
// peer and host name verification. Returns false on transport failure with
// `err` set; any HTTP status counts as success at this level.
bool http_request(const HttpRequest& req, HttpResponse& out, std::string& err);

// Value of the Host header http_request() sends (port only when non-default).
std::string http_host_header(const HttpRequest& req);

// Splits a raw response (status line, headers, body; chunked bodies decoded).
bool http_parse_response(const std::string& raw, HttpResponse& out);

}
