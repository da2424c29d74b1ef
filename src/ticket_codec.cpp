#include "ticket_codec.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <vector>

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr make_gcm_context(const TicketKey& key, const unsigned char* nonce, bool encrypt) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if(!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");
  int ok = encrypt
    ? EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
    : EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
  if(ok != 1) throw CryptoError("AES-256-GCM init failed");
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kTicketNonceSize), nullptr) != 1) {
    throw CryptoError("unable to set GCM nonce length");
  }
  ok = encrypt
    ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce)
    : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce);
  if(ok != 1) throw CryptoError("unable to load ticket key");
  return ctx;
}

struct TicketEnvelope {
  std::string sender_identity;
  std::string encoded;
};

TicketEnvelope split_envelope(const std::string& ticket) {
  const std::string scheme(kTicketScheme);
  if(ticket.compare(0, scheme.size(), scheme) != 0) {
    throw FormatError("Invalid ticket format: missing '" + scheme + "' prefix");
  }
  std::string rest = ticket.substr(scheme.size());
  auto sep = rest.find(':');
  if(sep == std::string::npos) {
    // no sender: still decode first so encoding problems are reported as such
    return TicketEnvelope{"", rest};
  }
  return TicketEnvelope{rest.substr(0, sep), rest.substr(sep + 1)};
}

} // namespace

TicketKey derive_ticket_key(const std::string& identity) {
  auto digest = sha256_bytes(std::string(kTicketKeyPrefix) + identity);
  TicketKey key{};
  std::copy(digest.begin(), digest.end(), key.begin());
  return key;
}

bool is_valid_ticket_identity(const std::string& identity) {
  return !identity.empty() && identity.find(':') == std::string::npos;
}

std::string encrypt_ticket(const std::string& plaintext, const std::string& sender_identity) {
  if(sender_identity.empty()) {
    throw FormatError("sender identity must not be empty");
  }
  if(!is_valid_ticket_identity(sender_identity)) {
    throw FormatError("sender identity '" + sender_identity + "' must not contain ':'");
  }
  auto key = derive_ticket_key(sender_identity);
  auto nonce = random_bytes(kTicketNonceSize);
  auto ctx = make_gcm_context(key, nonce.data(), true);

  // nonce || ciphertext || tag
  std::vector<unsigned char> combined(kTicketNonceSize + plaintext.size() + kTicketTagSize);
  std::memcpy(combined.data(), nonce.data(), kTicketNonceSize);
  unsigned char* out = combined.data() + kTicketNonceSize;

  int len = 0;
  if(!plaintext.empty()) {
    if(EVP_EncryptUpdate(ctx.get(), out, &len,
                         reinterpret_cast<const unsigned char*>(plaintext.data()),
                         static_cast<int>(plaintext.size())) != 1) {
      throw CryptoError("Encryption failed");
    }
  }
  int final_len = 0;
  if(EVP_EncryptFinal_ex(ctx.get(), out + len, &final_len) != 1) {
    throw CryptoError("Encryption failed");
  }
  std::size_t cipher_len = static_cast<std::size_t>(len + final_len);
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTicketTagSize),
                         out + cipher_len) != 1) {
    throw CryptoError("unable to read GCM tag");
  }
  combined.resize(kTicketNonceSize + cipher_len + kTicketTagSize);

  return std::string(kTicketScheme) + sender_identity + ":" + base64url_encode(combined);
}

std::string decrypt_ticket(const std::string& ticket, const std::string& /*receiver_identity*/) {
  auto envelope = split_envelope(ticket);

  auto combined = base64url_decode(envelope.encoded);
  if(!combined) {
    throw EncodingError("Invalid ticket encoding");
  }
  if(combined->size() < kTicketNonceSize) {
    throw FormatError("Invalid ticket: too short");
  }
  if(envelope.sender_identity.empty()) {
    throw FormatError("Invalid ticket format: missing sender identity");
  }
  if(combined->size() < kTicketNonceSize + kTicketTagSize) {
    throw CryptoError("Decryption failed: ciphertext truncated");
  }

  auto key = derive_ticket_key(envelope.sender_identity);
  auto ctx = make_gcm_context(key, combined->data(), false);

  const unsigned char* cipher = combined->data() + kTicketNonceSize;
  std::size_t cipher_len = combined->size() - kTicketNonceSize - kTicketTagSize;
  std::vector<unsigned char> tag(cipher + cipher_len, cipher + cipher_len + kTicketTagSize);

  std::string plaintext(cipher_len, '\0');
  int len = 0;
  if(cipher_len > 0) {
    if(EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]), &len,
                         cipher, static_cast<int>(cipher_len)) != 1) {
      throw CryptoError("Decryption failed");
    }
  }
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTicketTagSize), tag.data()) != 1) {
    throw CryptoError("unable to set GCM tag");
  }
  unsigned char final_block[16];
  int final_len = 0;
  if(EVP_DecryptFinal_ex(ctx.get(), final_block, &final_len) != 1) {
    throw CryptoError("Decryption failed: authentication tag mismatch");
  }
  plaintext.resize(static_cast<std::size_t>(len));

  if(!is_valid_utf8(plaintext)) {
    throw CryptoError("Invalid ticket format: plaintext is not valid UTF-8");
  }
  return plaintext;
}

std::string ticket_sender_identity(const std::string& ticket) {
  auto envelope = split_envelope(ticket);
  if(envelope.sender_identity.empty()) {
    throw FormatError("Invalid ticket format: missing sender identity");
  }
  return envelope.sender_identity;
}
