#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kPresenceTopic = "vegam/presence/1";

struct PresenceAnnouncement {
  std::string device_id;
  std::string display_name;
  uint64_t timestamp = 0; // epoch seconds at the sender
};

json make_presence_announcement(const PresenceAnnouncement& announcement);
std::string encode_presence_announcement(const PresenceAnnouncement& announcement);

// Throws FormatError for anything that is not a presence message on our topic.
PresenceAnnouncement decode_presence_announcement(const std::string& payload);

// Blob endpoint wire messages, one JSON object per line.
json make_blob_request(const std::string& hash);
json make_blob_header(const std::string& node_id, const std::string& hash, uint64_t size);
json make_blob_error(const std::string& hash, const std::string& message);
