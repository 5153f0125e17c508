#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace {

bool iequals(std::string_view a, std::string_view b){
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
}

std::string trim(std::string_view s){
    while(!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while(!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return std::string(s);
}

bool contains_token(const std::string& value, std::string_view token){
    std::size_t pos = 0;
    while(pos <= value.size()){
        auto comma = value.find(',', pos);
        if(comma == std::string::npos) comma = value.size();
        if(iequals(trim(std::string_view(value).substr(pos, comma - pos)), token)) return true;
        pos = comma + 1;
    }
    return false;
}

int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    for(const auto& [key, value] : headers){
        if(iequals(key, name)) return value;
    }
    return std::nullopt;
}

bool HttpRequest::keep_alive() const {
    auto connection = header("Connection");
    if(version_minor == 0){
        return connection && contains_token(*connection, "keep-alive");
    }
    return !(connection && contains_token(*connection, "close"));
}

bool HttpRequest::chunked() const {
    auto te = header("Transfer-Encoding");
    return te && contains_token(*te, "chunked");
}

bool parse_request_head(const std::string& head, HttpRequest& out, std::string& error){
    auto eol = head.find("\r\n");
    const std::string line = head.substr(0, eol);

    auto sp1 = line.find(' ');
    auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
    if(sp1 == std::string::npos || sp2 == std::string::npos){
        error = "malformed request line";
        return false;
    }
    out.method = line.substr(0, sp1);
    out.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    const std::string version = line.substr(sp2 + 1);
    if(version == "HTTP/1.1"){
        out.version_minor = 1;
    } else if(version == "HTTP/1.0"){
        out.version_minor = 0;
    } else {
        error = "unsupported protocol version '" + version + "'";
        return false;
    }
    if(out.method.empty() || out.target.empty() || out.target.front() != '/'){
        error = "malformed request target";
        return false;
    }
    auto q = out.target.find('?');
    out.path = out.target.substr(0, q);
    out.query = q == std::string::npos ? std::string() : out.target.substr(q + 1);

    out.headers.clear();
    std::size_t pos = eol == std::string::npos ? head.size() : eol + 2;
    while(pos < head.size()){
        auto next = head.find("\r\n", pos);
        if(next == std::string::npos) next = head.size();
        std::string_view field(head.data() + pos, next - pos);
        pos = next + 2;
        if(field.empty()) continue;
        auto colon = field.find(':');
        if(colon == std::string_view::npos || colon == 0){
            error = "malformed header line";
            return false;
        }
        out.headers.emplace_back(trim(field.substr(0, colon)), trim(field.substr(colon + 1)));
    }
    return true;
}

bool parse_content_length(const HttpRequest& req, std::optional<std::uint64_t>& length){
    length.reset();
    auto value = req.header("Content-Length");
    if(!value) return true;
    std::uint64_t n = 0;
    const char* b = value->data();
    const char* e = b + value->size();
    auto [ptr, ec] = std::from_chars(b, e, n);
    if(value->empty() || ec != std::errc() || ptr != e) return false;
    length = n;
    return true;
}

std::string url_decode(std::string_view text){
    std::string out;
    out.reserve(text.size());
    for(std::size_t i = 0; i < text.size(); ++i){
        const char c = text[i];
        if(c == '%' && i + 2 < text.size()){
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if(hi >= 0 && lo >= 0){
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string multipart_boundary(const std::string& content_type){
    auto semi = content_type.find(';');
    if(!iequals(trim(std::string_view(content_type).substr(0, semi)), "multipart/form-data")) return {};
    std::size_t pos = semi;
    while(pos != std::string::npos && pos < content_type.size()){
        auto next = content_type.find(';', pos + 1);
        std::string param = trim(std::string_view(content_type).substr(pos + 1,
            (next == std::string::npos ? content_type.size() : next) - pos - 1));
        auto eq = param.find('=');
        if(eq != std::string::npos && iequals(trim(std::string_view(param).substr(0, eq)), "boundary")){
            std::string value = trim(std::string_view(param).substr(eq + 1));
            if(value.size() >= 2 && value.front() == '"' && value.back() == '"'){
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
        pos = next;
    }
    return {};
}

const char* status_text(int status){
    switch(status){
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string make_response_head(int status,
                               const HttpHeaders& headers,
                               std::optional<std::uint64_t> content_length,
                               bool keep_alive){
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
    bool has_connection = false;
    for(const auto& [key, value] : headers){
        if(iequals(key, "Connection")) has_connection = true;
        head += key + ": " + value + "\r\n";
    }
    if(content_length){
        head += "Content-Length: " + std::to_string(*content_length) + "\r\n";
    }
    if(!has_connection){
        head += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    }
    head += "\r\n";
    return head;
}

std::string make_text_response(int status, const std::string& body, bool keep_alive){
    return make_response_head(status, {{"Content-Type", "text/plain; charset=utf-8"}},
                              body.size(), keep_alive) + body;
}
