#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "transfer_registry.hpp"

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kConnectionReplaced = "CONNECTION_REPLACED";
inline constexpr const char* kEmptyTransferList = "[]";

json make_transfer_list(const std::vector<TransferSnapshot>& transfers);
json make_presence(bool mobile_connected, bool desktop_connected);

// `{"progress": N}`, the body of per-transfer and packaging events
std::string make_progress_payload(int percent);

// One server-sent event frame: "data: <payload>\n\n"
std::string make_sse_event(const std::string& payload);
