#include "device_class.hpp"

#include <algorithm>

namespace {

constexpr std::string_view kMobileKeywords[] = {
  "Mobile",
  "Android",
  "iPhone",
  "iPod",
  "BlackBerry",
  "Windows Phone",
  "Opera Mini",
  "IEMobile",
};

} // namespace

DeviceClass classify_user_agent(std::string_view user_agent) {
  const bool mobile = std::any_of(std::begin(kMobileKeywords), std::end(kMobileKeywords),
    [&](std::string_view keyword){ return user_agent.find(keyword) != std::string_view::npos; });
  return mobile ? DeviceClass::Mobile : DeviceClass::Desktop;
}

DeviceClass complement(DeviceClass device) {
  return device == DeviceClass::Mobile ? DeviceClass::Desktop : DeviceClass::Mobile;
}

BroadcastClass reporting_class(DeviceClass origin) {
  return origin == DeviceClass::Mobile ? BroadcastClass::Desktop : BroadcastClass::Mobile;
}

std::optional<DeviceClass> reported_device(BroadcastClass cls) {
  switch(cls) {
    case BroadcastClass::Mobile: return DeviceClass::Desktop;
    case BroadcastClass::Desktop: return DeviceClass::Mobile;
    default: return std::nullopt;
  }
}

const char* to_string(DeviceClass device) {
  return device == DeviceClass::Mobile ? "mobile" : "desktop";
}

const char* to_string(BroadcastClass cls) {
  switch(cls) {
    case BroadcastClass::Mobile: return "mobile";
    case BroadcastClass::Desktop: return "desktop";
    case BroadcastClass::Packaging: return "packaging";
    case BroadcastClass::Presence: return "presence";
  }
  return "unknown";
}
