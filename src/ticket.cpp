#include "ticket.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

constexpr const char* kBlobPrefix = "blob:";

bool is_hex_digest(const std::string& value) {
  if(value.size() != 64) return false;
  return std::all_of(value.begin(), value.end(), [](unsigned char c){
    return std::isdigit(c) || (c >= 'a' && c <= 'f');
  });
}

std::vector<std::string> split(const std::string& text, char delim) {
  std::vector<std::string> parts;
  std::string item;
  std::istringstream iss(text);
  while(std::getline(iss, item, delim)) {
    if(!item.empty()) parts.push_back(item);
  }
  return parts;
}

} // namespace

std::string BlobAddress::to_string() const {
  std::string out = kBlobPrefix + node_id + "@";
  for(std::size_t i = 0; i < direct_addrs.size(); ++i) {
    if(i > 0) out += ",";
    out += direct_addrs[i];
  }
  out += "#" + hash;
  return out;
}

BlobAddress BlobAddress::parse(const std::string& text) {
  const std::string prefix(kBlobPrefix);
  if(text.compare(0, prefix.size(), prefix) != 0) {
    throw FormatError("Invalid address token: missing '" + prefix + "' prefix");
  }
  auto at = text.find('@', prefix.size());
  auto hash_sep = text.rfind('#');
  if(at == std::string::npos || hash_sep == std::string::npos || hash_sep < at) {
    throw FormatError("Invalid address token: expected <node>@<addrs>#<hash>");
  }
  BlobAddress addr;
  addr.node_id = text.substr(prefix.size(), at - prefix.size());
  addr.direct_addrs = split(text.substr(at + 1, hash_sep - at - 1), ',');
  addr.hash = text.substr(hash_sep + 1);
  if(addr.node_id.empty()) {
    throw FormatError("Invalid address token: empty node id");
  }
  if(!is_hex_digest(addr.hash)) {
    throw FormatError("Invalid address token: content id is not a sha256 digest");
  }
  return addr;
}

std::string sanitize_ticket_file_name(const std::string& name) {
  std::string out = name;
  std::replace(out.begin(), out.end(), '|', '_');
  return out;
}

std::string compose_ticket_plaintext(const TransferTicket& ticket) {
  return sanitize_ticket_file_name(ticket.file_name) + "|" +
         std::to_string(ticket.file_size) + "|" +
         ticket.address.to_string();
}

TicketPayload parse_ticket_plaintext(const std::string& plaintext) {
  auto first = plaintext.find('|');
  auto second = first == std::string::npos ? std::string::npos : plaintext.find('|', first + 1);
  if(second == std::string::npos) {
    return LegacyTicket{BlobAddress::parse(plaintext)};
  }

  TransferTicket ticket;
  ticket.file_name = plaintext.substr(0, first);
  std::string size_field = plaintext.substr(first + 1, second - first - 1);
  if(size_field.empty() || !std::all_of(size_field.begin(), size_field.end(),
                                        [](unsigned char c){ return std::isdigit(c); })) {
    throw FormatError("Invalid ticket: size field '" + size_field + "' is not a number");
  }
  try {
    ticket.file_size = std::stoull(size_field);
  } catch(const std::out_of_range&) {
    throw FormatError("Invalid ticket: size field out of range");
  }
  ticket.address = BlobAddress::parse(plaintext.substr(second + 1));
  return ticket;
}

TransferTicket resolve_ticket(const TicketPayload& payload) {
  if(const auto* full = std::get_if<TransferTicket>(&payload)) {
    return *full;
  }
  TransferTicket ticket;
  ticket.file_name = kLegacyTicketFileName;
  ticket.file_size = 0;
  ticket.address = std::get<LegacyTicket>(payload).address;
  return ticket;
}

bool is_legacy_ticket(const TicketPayload& payload) {
  return std::holds_alternative<LegacyTicket>(payload);
}
