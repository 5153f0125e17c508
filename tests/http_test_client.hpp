#pragma once

#include <asio.hpp>

#include <array>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace qrdrop::test {

inline constexpr const char* kDesktopAgent =
  "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36";
inline constexpr const char* kMobileAgent =
  "Mozilla/5.0 (Linux; Android 14; Pixel 8) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Mobile Safari/537.36";

struct TestResponse {
  int status = 0;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  bool parsed = false;

  std::optional<std::string> header(const std::string& name) const {
    for(const auto& [key, value] : headers) {
      if(key.size() != name.size()) continue;
      bool same = true;
      for(std::size_t i = 0; i < key.size(); ++i) {
        if(std::tolower(static_cast<unsigned char>(key[i])) !=
           std::tolower(static_cast<unsigned char>(name[i]))) {
          same = false;
          break;
        }
      }
      if(same) return value;
    }
    return std::nullopt;
  }
};

// Splits a raw response into status, headers and body.
inline TestResponse parse_response(const std::string& raw) {
  TestResponse res;
  const auto head_end = raw.find("\r\n\r\n");
  if(head_end == std::string::npos) return res;
  const std::string head = raw.substr(0, head_end);
  res.body = raw.substr(head_end + 4);

  std::size_t line_end = head.find("\r\n");
  const std::string status_line = head.substr(0, line_end);
  const auto sp = status_line.find(' ');
  if(sp == std::string::npos) return res;
  res.status = std::atoi(status_line.c_str() + sp + 1);

  while(line_end != std::string::npos) {
    const std::size_t start = line_end + 2;
    line_end = head.find("\r\n", start);
    const std::string line = head.substr(start, line_end == std::string::npos ? std::string::npos : line_end - start);
    const auto colon = line.find(':');
    if(colon == std::string::npos) continue;
    std::string value = line.substr(colon + 1);
    while(!value.empty() && value.front() == ' ') value.erase(value.begin());
    res.headers.emplace_back(line.substr(0, colon), value);
  }
  res.parsed = true;
  return res;
}

// multipart/form-data body with a `size` field followed by a `file` field.
inline std::string make_upload_body(const std::string& boundary,
                                    const std::string& size_text,
                                    const std::string& filename,
                                    const std::string& content) {
  std::string body;
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"size\"\r\n\r\n";
  body += size_text + "\r\n";
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n";
  body += "Content-Type: application/octet-stream\r\n\r\n";
  body += content + "\r\n";
  body += "--" + boundary + "--\r\n";
  return body;
}

// One request per connection; the response is read until the server closes.
class HttpTestClient {
public:
  explicit HttpTestClient(std::uint16_t port, std::string host = "127.0.0.1")
    : host_(std::move(host)), port_(port) {}

  TestResponse request(const std::string& method,
                       const std::string& target,
                       const std::vector<std::pair<std::string, std::string>>& headers = {},
                       const std::string& body = std::string(),
                       bool send_length = true) const {
    std::string raw = method + " " + target + " HTTP/1.1\r\n";
    raw += "Host: " + host_ + "\r\n";
    raw += "Connection: close\r\n";
    for(const auto& [key, value] : headers) {
      raw += key + ": " + value + "\r\n";
    }
    if(send_length && (!body.empty() || method == "POST")) {
      raw += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    raw += "\r\n";
    raw += body;
    return parse_response(exchange(raw));
  }

  TestResponse upload(const std::string& target,
                      const std::string& filename,
                      const std::string& content,
                      const std::string& user_agent = kDesktopAgent,
                      std::optional<std::string> size_text = std::nullopt) const {
    const std::string boundary = "----qrdropBoundary7MA4YWxkTrZu0gW";
    const std::string body = make_upload_body(boundary,
                                              size_text.value_or(std::to_string(content.size())),
                                              filename, content);
    return request("POST", target,
                   {{"User-Agent", user_agent},
                    {"Content-Type", "multipart/form-data; boundary=" + boundary}},
                   body);
  }

  // Writes the request, then reads until EOF. A reset after data arrived
  // still yields what was received.
  std::string exchange(const std::string& raw) const {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address(host_), port_));
    std::error_code ec;
    asio::write(socket, asio::buffer(raw), ec);

    std::string received;
    std::array<char, 16 * 1024> chunk{};
    for(;;) {
      const std::size_t n = socket.read_some(asio::buffer(chunk), ec);
      received.append(chunk.data(), n);
      if(ec) break;
    }
    return received;
  }

private:
  std::string host_;
  std::uint16_t port_;
};

// Reads a text/event-stream response on a background thread and queues the
// payload of every `data:` line.
class EventStreamClient {
public:
  EventStreamClient(std::uint16_t port,
                    const std::string& target,
                    const std::string& user_agent = kDesktopAgent)
    : socket_(io_) {
    socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    std::string raw = "GET " + target + " HTTP/1.1\r\n";
    raw += "Host: 127.0.0.1\r\n";
    if(!user_agent.empty()) {
      raw += "User-Agent: " + user_agent + "\r\n";
    }
    raw += "Accept: text/event-stream\r\n\r\n";
    asio::write(socket_, asio::buffer(raw));
    reader_ = std::thread([this](){ read_loop(); });
  }

  ~EventStreamClient() {
    close();
  }

  EventStreamClient(const EventStreamClient&) = delete;
  EventStreamClient& operator=(const EventStreamClient&) = delete;

  std::optional<std::string> next_event(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]{ return !events_.empty() || ended_; });
    if(events_.empty()) return std::nullopt;
    auto value = std::move(events_.front());
    events_.pop_front();
    return value;
  }

  // Waits until the server ends the response.
  bool wait_closed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{ return ended_; });
  }

  int status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
  }

  bool ended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_;
  }

  void close() {
    if(closing_) return;
    closing_ = true;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if(reader_.joinable()) reader_.join();
    socket_.close(ec);
  }

private:
  void read_loop() {
    std::string pending;
    bool head_done = false;
    std::array<char, 4096> chunk{};
    for(;;) {
      std::error_code ec;
      const std::size_t n = socket_.read_some(asio::buffer(chunk), ec);
      pending.append(chunk.data(), n);

      if(!head_done) {
        const auto end = pending.find("\r\n\r\n");
        if(end != std::string::npos) {
          auto head = parse_response(pending.substr(0, end + 4));
          pending.erase(0, end + 4);
          head_done = true;
          std::lock_guard<std::mutex> lock(mutex_);
          status_ = head.status;
        }
      }
      if(head_done) {
        std::size_t frame_end;
        while((frame_end = pending.find("\n\n")) != std::string::npos) {
          const std::string frame = pending.substr(0, frame_end);
          pending.erase(0, frame_end + 2);
          if(frame.rfind("data: ", 0) == 0) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(frame.substr(6));
            cv_.notify_all();
          }
        }
      }
      if(ec) break;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ended_ = true;
    cv_.notify_all();
  }

  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  std::thread reader_;
  bool closing_ = false;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> events_;
  int status_ = 0;
  bool ended_ = false;
};

} // namespace qrdrop::test
