#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;   // as sent, e.g. "/progress/a%20b.txt?x=1"
    std::string path;     // target without the query, still percent-encoded
    std::string query;
    int version_minor = 1; // HTTP/1.x
    HttpHeaders headers;

    // Case-insensitive lookup of the first header named `name`.
    std::optional<std::string> header(const std::string& name) const;
    bool keep_alive() const;
    bool chunked() const;
};

// Parses the request line and headers (everything before the blank line).
bool parse_request_head(const std::string& head, HttpRequest& out, std::string& error);

// Reads Content-Length. Returns false when the header is present but invalid;
// `length` stays empty when the header is absent.
bool parse_content_length(const HttpRequest& req, std::optional<std::uint64_t>& length);

// %XX decoding of a path segment; malformed escapes are kept literally.
std::string url_decode(std::string_view text);

// Boundary parameter of a multipart/form-data Content-Type, empty otherwise.
std::string multipart_boundary(const std::string& content_type);

const char* status_text(int status);

// Status line and headers ending with the blank line. Without a content
// length the body runs until the connection closes.
std::string make_response_head(int status,
                               const HttpHeaders& headers,
                               std::optional<std::uint64_t> content_length,
                               bool keep_alive);

std::string make_text_response(int status, const std::string& body, bool keep_alive);
