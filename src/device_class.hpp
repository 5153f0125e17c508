#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

enum class DeviceClass { Mobile, Desktop };

// Each broadcast class owns one slot, one dirty signal and at most one pump.
enum class BroadcastClass { Mobile, Desktop, Packaging, Presence };

inline constexpr std::size_t kBroadcastClassCount = 4;

inline constexpr std::array<BroadcastClass, kBroadcastClassCount> kAllBroadcastClasses = {
  BroadcastClass::Mobile, BroadcastClass::Desktop, BroadcastClass::Packaging, BroadcastClass::Presence
};

DeviceClass classify_user_agent(std::string_view user_agent);

DeviceClass complement(DeviceClass device);

// The aggregate stream on which transfers started by `origin` are reported:
// a phone watches the desktop's uploads and vice versa.
BroadcastClass reporting_class(DeviceClass origin);

// Device class whose transfers an aggregate class reports, if it is one.
std::optional<DeviceClass> reported_device(BroadcastClass cls);

constexpr std::size_t index_of(BroadcastClass cls) {
  return static_cast<std::size_t>(cls);
}

const char* to_string(DeviceClass device);
const char* to_string(BroadcastClass cls);
