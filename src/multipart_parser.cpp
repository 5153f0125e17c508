#include "multipart_parser.hpp"

#include <cctype>
#include <utility>

namespace {

std::string lower(std::string value) {
  for(auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return value;
}

std::string trim(const std::string& value) {
  std::size_t b = 0;
  std::size_t e = value.size();
  while(b < e && (value[b] == ' ' || value[b] == '\t')) ++b;
  while(e > b && (value[e - 1] == ' ' || value[e - 1] == '\t')) --e;
  return value.substr(b, e - b);
}

// Reads a token or a quoted string starting at `pos`; leaves `pos` after it.
std::string read_param_value(const std::string& s, std::size_t& pos) {
  std::string out;
  if(pos < s.size() && s[pos] == '"') {
    ++pos;
    while(pos < s.size() && s[pos] != '"') {
      if(s[pos] == '\\' && pos + 1 < s.size()) ++pos;
      out.push_back(s[pos++]);
    }
    if(pos < s.size()) ++pos; // closing quote
    return out;
  }
  while(pos < s.size() && s[pos] != ';') out.push_back(s[pos++]);
  return trim(out);
}

} // namespace

bool parse_content_disposition(const std::string& value, PartInfo& info) {
  auto semi = value.find(';');
  if(lower(trim(value.substr(0, semi))) != "form-data") return false;

  std::size_t pos = semi == std::string::npos ? value.size() : semi + 1;
  while(pos < value.size()) {
    while(pos < value.size() && (value[pos] == ' ' || value[pos] == '\t' || value[pos] == ';')) ++pos;
    auto eq = value.find('=', pos);
    if(eq == std::string::npos) break;
    std::string key = lower(trim(value.substr(pos, eq - pos)));
    pos = eq + 1;
    std::string param = read_param_value(value, pos);
    if(key == "name") {
      info.name = param;
    } else if(key == "filename") {
      info.filename = param;
      info.has_filename = true;
    }
    auto next = value.find(';', pos);
    pos = next == std::string::npos ? value.size() : next + 1;
  }
  return true;
}

MultipartParser::MultipartParser(const std::string& boundary, Callbacks callbacks)
  : delimiter_("\r\n--" + boundary),
    buffer_("\r\n"), // lets a boundary on the very first line match the delimiter
    callbacks_(std::move(callbacks)) {
  if(boundary.empty() || boundary.size() > 70) {
    throw MultipartError("invalid multipart boundary");
  }
}

void MultipartParser::feed(const char* data, std::size_t size) {
  if(state_ == State::Done) return; // epilogue
  buffer_.append(data, size);
  while(step()) {}
}

void MultipartParser::finish() {
  if(state_ != State::Done) {
    throw MultipartError("multipart body ended before the closing boundary");
  }
}

// Consumes as much of buffer_ as the current state allows. Returns true when
// it made progress and another step may follow.
bool MultipartParser::step() {
  switch(state_) {
    case State::Preamble: {
      auto pos = buffer_.find(delimiter_);
      if(pos == std::string::npos) {
        if(buffer_.size() >= delimiter_.size()) {
          buffer_.erase(0, buffer_.size() - delimiter_.size() + 1);
        }
        return false;
      }
      buffer_.erase(0, pos + delimiter_.size());
      state_ = State::AfterBoundary;
      return true;
    }

    case State::AfterBoundary: {
      std::size_t i = 0;
      while(i < buffer_.size() && (buffer_[i] == ' ' || buffer_[i] == '\t')) ++i;
      if(buffer_.size() - i < 2) return false;
      if(buffer_.compare(i, 2, "--") == 0) {
        buffer_.clear();
        state_ = State::Done;
        if(callbacks_.on_body_end) callbacks_.on_body_end();
        return false;
      }
      if(buffer_.compare(i, 2, "\r\n") != 0) {
        throw MultipartError("garbage after multipart boundary");
      }
      buffer_.erase(0, i + 2);
      state_ = State::Headers;
      return true;
    }

    case State::Headers: {
      if(buffer_.size() >= 2 && buffer_.compare(0, 2, "\r\n") == 0) {
        // part without headers
        buffer_.erase(0, 2);
        parse_headers(std::string());
        return true;
      }
      auto end = buffer_.find("\r\n\r\n");
      if(end == std::string::npos) {
        if(buffer_.size() > kMaxHeaderBytes) {
          throw MultipartError("multipart part headers too large");
        }
        return false;
      }
      std::string block = buffer_.substr(0, end);
      buffer_.erase(0, end + 4);
      parse_headers(block);
      return true;
    }

    case State::Body: {
      auto pos = buffer_.find(delimiter_);
      if(pos == std::string::npos) {
        // Keep a tail that may hold the start of the next delimiter.
        const std::size_t keep = delimiter_.size() - 1;
        if(buffer_.size() > keep) {
          const std::size_t emit = buffer_.size() - keep;
          if(callbacks_.on_part_data) callbacks_.on_part_data(buffer_.data(), emit);
          buffer_.erase(0, emit);
        }
        return false;
      }
      if(pos > 0 && callbacks_.on_part_data) {
        callbacks_.on_part_data(buffer_.data(), pos);
      }
      buffer_.erase(0, pos + delimiter_.size());
      state_ = State::AfterBoundary;
      if(callbacks_.on_part_end) callbacks_.on_part_end();
      return true;
    }

    case State::Done:
      return false;
  }
  return false;
}

void MultipartParser::parse_headers(const std::string& block) {
  PartInfo info;
  bool disposition = false;
  std::size_t pos = 0;
  while(pos < block.size()) {
    auto eol = block.find("\r\n", pos);
    if(eol == std::string::npos) eol = block.size();
    std::string line = block.substr(pos, eol - pos);
    pos = eol + 2;
    if(line.empty()) continue;

    auto colon = line.find(':');
    if(colon == std::string::npos) {
      throw MultipartError("malformed multipart header line");
    }
    std::string name = lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));
    if(name == "content-disposition") {
      if(!parse_content_disposition(value, info)) {
        throw MultipartError("multipart part is not form-data");
      }
      disposition = true;
    } else if(name == "content-type") {
      info.content_type = value;
    }
  }
  if(!disposition) {
    throw MultipartError("multipart part without Content-Disposition");
  }
  state_ = State::Body;
  if(callbacks_.on_part_begin) callbacks_.on_part_begin(info);
}
