#include "protocol.hpp"

json make_transfer_list(const std::vector<TransferSnapshot>& transfers){
    json j = json::array();
    for(const auto& t : transfers){
        j.push_back({{"name", t.name}, {"size", t.size}, {"progress", t.progress}});
    }
    return j;
}

json make_presence(bool mobile_connected, bool desktop_connected){
    json j;
    j["mobile"] = mobile_connected;
    j["desktop"] = desktop_connected;
    return j;
}

std::string make_progress_payload(int percent){
    return "{\"progress\": " + std::to_string(percent) + "}";
}

std::string make_sse_event(const std::string& payload){
    std::string frame;
    frame.reserve(payload.size() + 8);
    frame += "data: ";
    frame += payload;
    frame += "\n\n";
    return frame;
}
