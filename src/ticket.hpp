#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

inline constexpr const char* kLegacyTicketFileName = "received_file";

// Where a blob lives: the providing node, the addresses it listens on and
// the content id. Text form: blob:<node_id>@<host:port>[,<host:port>...]#<sha256>
struct BlobAddress {
  std::string node_id;
  std::vector<std::string> direct_addrs;
  std::string hash;

  std::string to_string() const;
  static BlobAddress parse(const std::string& text); // throws FormatError
};

// name|size|address
struct TransferTicket {
  std::string file_name;
  uint64_t file_size = 0;
  BlobAddress address;
};

// Bare address token produced by older senders.
struct LegacyTicket {
  BlobAddress address;
};

using TicketPayload = std::variant<TransferTicket, LegacyTicket>;

std::string compose_ticket_plaintext(const TransferTicket& ticket);

// Three '|'-separated fields select TransferTicket; anything else is parsed
// as a legacy bare address. Throws FormatError.
TicketPayload parse_ticket_plaintext(const std::string& plaintext);

// Legacy tickets become "received_file" with size 0.
TransferTicket resolve_ticket(const TicketPayload& payload);

bool is_legacy_ticket(const TicketPayload& payload);

// '|' would split the record, so it is replaced.
std::string sanitize_ticket_file_name(const std::string& name);
