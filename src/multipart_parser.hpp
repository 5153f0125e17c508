#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

class MultipartError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct PartInfo {
  std::string name;
  std::string filename;
  bool has_filename = false;
  std::string content_type;
};

// Parses `form-data; name="file"; filename="a.txt"` into `info`.
// Returns false when the value is not a form-data disposition.
bool parse_content_disposition(const std::string& value, PartInfo& info);

// Push parser for multipart/form-data bodies. Input may be split at any byte;
// part payloads are forwarded as soon as they cannot belong to a boundary.
// Callbacks run on the feeding thread and may throw to abort parsing.
class MultipartParser {
public:
  struct Callbacks {
    std::function<void(const PartInfo&)> on_part_begin;
    std::function<void(const char* data, std::size_t size)> on_part_data;
    std::function<void()> on_part_end;
    std::function<void()> on_body_end;
  };

  static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

  MultipartParser(const std::string& boundary, Callbacks callbacks);

  // Throws MultipartError on malformed input.
  void feed(const char* data, std::size_t size);

  // Throws MultipartError unless the closing boundary has been seen.
  void finish();

  bool done() const { return state_ == State::Done; }

private:
  enum class State { Preamble, AfterBoundary, Headers, Body, Done };

  bool step();
  void parse_headers(const std::string& block);

  State state_ = State::Preamble;
  std::string delimiter_; // "\r\n--" + boundary
  std::string buffer_;
  Callbacks callbacks_;
};
