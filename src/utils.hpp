#pragma once
#include <cstdint>
#include <optional>
#include <string>

inline constexpr std::uint64_t kMiB = 1024ull * 1024ull;
inline constexpr std::uint64_t kGiB = 1024ull * kMiB;

// floor(written * 100 / total) clamped to 100; an empty total counts as done.
int progress_percent(std::uint64_t written, std::uint64_t total);

// Tracks 5% boundaries: `advance` returns the new multiple of 5 when `percent`
// moved past the last reported boundary, nothing otherwise.
class ProgressBuckets {
public:
  static constexpr int kStep = 5;

  std::optional<int> advance(int percent);
  int last_reported() const { return last_; }

private:
  int last_ = 0;
};

// Shortens long names for log lines and screens: "averyveryverylong[...].pdf".
std::string display_name(const std::string& full_name);

// Final path component of a client-supplied name; empty when unusable.
std::string storage_name(const std::string& client_name);
