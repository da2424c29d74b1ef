#pragma once
#include <array>
#include <cstddef>
#include <string>

inline constexpr const char* kTicketScheme = "vegam://";
inline constexpr const char* kTicketKeyPrefix = "vegam-ticket-key-";
inline constexpr std::size_t kTicketNonceSize = 12;
inline constexpr std::size_t kTicketTagSize = 16;

using TicketKey = std::array<unsigned char, 32>;

// SHA-256(kTicketKeyPrefix || identity). The identity is public, so the key
// only obfuscates tickets in transit; anyone holding a ticket can open it.
TicketKey derive_ticket_key(const std::string& identity);

// An identity is written verbatim ahead of the first ':' in a ticket, so it
// must be non-empty and free of ':'.
bool is_valid_ticket_identity(const std::string& identity);

// AES-256-GCM with a fresh 96-bit nonce per call.
// Output: vegam://<sender_identity>:<base64url(nonce || ciphertext || tag)>
// Throws FormatError if the identity fails is_valid_ticket_identity.
std::string encrypt_ticket(const std::string& plaintext, const std::string& sender_identity);

// The key is re-derived from the sender identity embedded in the ticket;
// receiver_identity is accepted for call-site symmetry and not used.
// Throws FormatError, EncodingError or CryptoError.
std::string decrypt_ticket(const std::string& ticket, const std::string& receiver_identity);

// Sender identity embedded in a ticket, without decrypting. Throws FormatError.
std::string ticket_sender_identity(const std::string& ticket);
