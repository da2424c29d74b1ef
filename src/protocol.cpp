#include "protocol.hpp"
#include "errors.hpp"

json make_presence_announcement(const PresenceAnnouncement& announcement) {
    json j;
    j["type"] = "presence";
    j["topic"] = kPresenceTopic;
    j["device_id"] = announcement.device_id;
    j["display_name"] = announcement.display_name;
    j["timestamp"] = announcement.timestamp;
    return j;
}

std::string encode_presence_announcement(const PresenceAnnouncement& announcement) {
    return make_presence_announcement(announcement).dump();
}

PresenceAnnouncement decode_presence_announcement(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch(const json::parse_error& e) {
        throw FormatError(std::string("announcement is not JSON: ") + e.what());
    }
    if(!j.is_object()) throw FormatError("announcement is not an object");
    auto string_field = [&j](const char* key) -> std::string {
        auto it = j.find(key);
        if(it == j.end() || !it->is_string()) return "";
        return it->get<std::string>();
    };
    if(string_field("type") != "presence") throw FormatError("not a presence message");
    if(string_field("topic") != kPresenceTopic) throw FormatError("announcement for another topic");

    auto id = j.find("device_id");
    auto name = j.find("display_name");
    auto ts = j.find("timestamp");
    if(id == j.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw FormatError("announcement without device_id");
    }
    if(name == j.end() || !name->is_string()) {
        throw FormatError("announcement without display_name");
    }
    if(ts == j.end() || !ts->is_number_unsigned()) {
        throw FormatError("announcement without timestamp");
    }

    PresenceAnnouncement a;
    a.device_id = id->get<std::string>();
    a.display_name = name->get<std::string>();
    a.timestamp = ts->get<uint64_t>();
    return a;
}

json make_blob_request(const std::string& hash) {
    json j;
    j["type"] = "blob_request";
    j["hash"] = hash;
    return j;
}

json make_blob_header(const std::string& node_id, const std::string& hash, uint64_t size) {
    json j;
    j["type"] = "blob_header";
    j["node_id"] = node_id;
    j["hash"] = hash;
    j["size"] = size;
    return j;
}

json make_blob_error(const std::string& hash, const std::string& message) {
    json j;
    j["type"] = "blob_error";
    j["hash"] = hash;
    j["message"] = message;
    return j;
}
