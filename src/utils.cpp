#include "utils.hpp"

#include <limits>

namespace {
constexpr std::size_t kDisplayMaxLen = 30;
constexpr const char* kDisplayDots = "[...]";
constexpr std::size_t kDisplayDotsLen = 5;
}

int progress_percent(std::uint64_t written, std::uint64_t total) {
  if(total == 0 || written >= total) return 100;
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  if(written <= kMax / 100) {
    return static_cast<int>(written * 100 / total);
  }
  const auto percent = written / (total / 100);
  return static_cast<int>(percent > 99 ? 99 : percent);
}

std::optional<int> ProgressBuckets::advance(int percent) {
  if(percent > 100) percent = 100;
  const int boundary = percent - percent % kStep;
  if(boundary <= last_) return std::nullopt;
  last_ = boundary;
  return boundary;
}

std::string display_name(const std::string& full_name) {
  if(full_name.size() <= kDisplayMaxLen) return full_name;
  const auto dot = full_name.rfind('.');
  const std::size_t ext_pos = dot == std::string::npos ? full_name.size() : dot;
  const std::string ext = full_name.substr(ext_pos);
  std::string stem;
  if(ext.size() + kDisplayDotsLen < kDisplayMaxLen) {
    stem = full_name.substr(0, kDisplayMaxLen - ext.size() - kDisplayDotsLen);
  }
  return stem + kDisplayDots + ext;
}

std::string storage_name(const std::string& client_name) {
  const auto slash = client_name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? client_name : client_name.substr(slash + 1);
  if(base == "." || base == "..") return {};
  if(base.find('\0') != std::string::npos) return {};
  return base;
}
