#include "errors.hpp"
#include "ticket.hpp"
#include "ticket_codec.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <string>
#include <vector>

namespace {

using vegam::test::TestCase;
using vegam::test::TestContext;
using vegam::test::throws_as;

const std::string kHash = sha256_hex(std::string("hello vegam"));

BlobAddress sample_address() {
  BlobAddress addr;
  addr.node_id = "node-a";
  addr.direct_addrs = {"192.168.1.20:40111", "127.0.0.1:40111"};
  addr.hash = kHash;
  return addr;
}

std::string encoded_part(const std::string& ticket) {
  return ticket.substr(ticket.rfind(':') + 1);
}

bool test_round_trip(TestContext&) {
  const std::string plain = "report.pdf|4096|" + sample_address().to_string();
  auto ticket = encrypt_ticket(plain, "device-A");
  VEGAM_CHECK(ticket.rfind("vegam://device-A:", 0) == 0);
  VEGAM_CHECK(decrypt_ticket(ticket, "device-A") == plain);
  VEGAM_CHECK(ticket_sender_identity(ticket) == "device-A");
  return true;
}

bool test_any_receiver_can_open(TestContext&) {
  auto ticket = encrypt_ticket("payload", "device-A");
  VEGAM_CHECK(decrypt_ticket(ticket, "device-B") == "payload");
  VEGAM_CHECK(decrypt_ticket(ticket, "") == "payload");
  return true;
}

bool test_fresh_nonce_per_ticket(TestContext&) {
  auto first = encrypt_ticket("same text", "device-A");
  auto second = encrypt_ticket("same text", "device-A");
  VEGAM_CHECK(first != second);
  auto other = encrypt_ticket("same text", "device-B");
  VEGAM_CHECK(other.find("device-B") != std::string::npos);
  VEGAM_CHECK(decrypt_ticket(other, "x") == "same text");
  return true;
}

bool test_ticket_charset(TestContext&) {
  auto ticket = encrypt_ticket("name with spaces|12|" + sample_address().to_string(), "abc123");
  for(char c : encoded_part(ticket)) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
              c == '-' || c == '_';
    VEGAM_CHECK(ok);
  }
  return true;
}

bool test_missing_scheme(TestContext&) {
  VEGAM_CHECK(throws_as<FormatError>([]{ decrypt_ticket("not-a-ticket", "me"); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ ticket_sender_identity("http://x:y"); }));
  return true;
}

bool test_bad_encoding(TestContext&) {
  VEGAM_CHECK(throws_as<EncodingError>([]{ decrypt_ticket("vegam://!!!", "me"); }));
  VEGAM_CHECK(throws_as<EncodingError>([]{ decrypt_ticket("vegam://device-A:***", "me"); }));
  return true;
}

bool test_short_payload(TestContext&) {
  VEGAM_CHECK(throws_as<FormatError>([]{ decrypt_ticket("vegam://AA", "me"); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ decrypt_ticket("vegam://device-A:AAAA", "me"); }));
  return true;
}

bool test_tampered_ticket(TestContext&) {
  auto ticket = encrypt_ticket("report.pdf|4096|" + sample_address().to_string(), "device-A");
  auto pos = ticket.rfind(':') + 1 + encoded_part(ticket).size() / 2;
  ticket[pos] = ticket[pos] == 'A' ? 'B' : 'A';
  VEGAM_CHECK(throws_as<CryptoError>([&]{ decrypt_ticket(ticket, "device-A"); }));
  return true;
}

bool test_wrong_sender_identity(TestContext&) {
  auto ticket = encrypt_ticket("secret", "device-A");
  auto forged = "vegam://device-Z:" + encoded_part(ticket);
  VEGAM_CHECK(throws_as<CryptoError>([&]{ decrypt_ticket(forged, "device-A"); }));
  return true;
}

bool test_identity_with_separator_rejected(TestContext&) {
  const std::string plain = "report.pdf|4096|x";
  VEGAM_CHECK(throws_as<FormatError>([&]{ encrypt_ticket(plain, "fe80::1"); }));
  VEGAM_CHECK(throws_as<FormatError>([&]{ encrypt_ticket(plain, "host:4000"); }));
  VEGAM_CHECK(throws_as<FormatError>([&]{ encrypt_ticket(plain, ""); }));
  VEGAM_CHECK(!is_valid_ticket_identity("fe80::1"));
  VEGAM_CHECK(is_valid_ticket_identity("node-1"));

  auto ticket = encrypt_ticket(plain, "node-1");
  VEGAM_CHECK(decrypt_ticket(ticket, "anything") == plain);
  return true;
}

bool test_blob_address_text(TestContext&) {
  auto addr = sample_address();
  auto text = addr.to_string();
  VEGAM_CHECK(text == "blob:node-a@192.168.1.20:40111,127.0.0.1:40111#" + kHash);
  auto parsed = BlobAddress::parse(text);
  VEGAM_CHECK(parsed.node_id == "node-a");
  VEGAM_CHECK(parsed.direct_addrs.size() == 2);
  VEGAM_CHECK(parsed.direct_addrs[1] == "127.0.0.1:40111");
  VEGAM_CHECK(parsed.hash == kHash);

  VEGAM_CHECK(throws_as<FormatError>([]{ BlobAddress::parse("node-a@1.2.3.4:1#abc"); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ BlobAddress::parse("blob:node-a@1.2.3.4:1#nothex"); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ BlobAddress::parse("blob:@1.2.3.4:1#" + kHash); }));
  return true;
}

bool test_plaintext_with_metadata(TestContext&) {
  TransferTicket ticket;
  ticket.file_name = "a|b.txt";
  ticket.file_size = 17;
  ticket.address = sample_address();
  auto plain = compose_ticket_plaintext(ticket);
  VEGAM_CHECK(plain.rfind("a_b.txt|17|blob:", 0) == 0);

  auto payload = parse_ticket_plaintext(plain);
  VEGAM_CHECK(!is_legacy_ticket(payload));
  auto resolved = resolve_ticket(payload);
  VEGAM_CHECK(resolved.file_name == "a_b.txt");
  VEGAM_CHECK(resolved.file_size == 17);
  VEGAM_CHECK(resolved.address.hash == kHash);
  return true;
}

bool test_legacy_plaintext(TestContext&) {
  auto payload = parse_ticket_plaintext(sample_address().to_string());
  VEGAM_CHECK(is_legacy_ticket(payload));
  auto resolved = resolve_ticket(payload);
  VEGAM_CHECK(resolved.file_name == kLegacyTicketFileName);
  VEGAM_CHECK(resolved.file_size == 0);
  VEGAM_CHECK(resolved.address.node_id == "node-a");
  return true;
}

bool test_malformed_plaintext(TestContext&) {
  VEGAM_CHECK(throws_as<FormatError>([]{ parse_ticket_plaintext("x|12kb|blob:n@h:1#" + kHash); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ parse_ticket_plaintext("x||blob:n@h:1#" + kHash); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ parse_ticket_plaintext("x|12|garbage"); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ parse_ticket_plaintext("garbage"); }));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"round_trip", test_round_trip},
    {"any_receiver_can_open", test_any_receiver_can_open},
    {"fresh_nonce_per_ticket", test_fresh_nonce_per_ticket},
    {"ticket_charset", test_ticket_charset},
    {"missing_scheme", test_missing_scheme},
    {"bad_encoding", test_bad_encoding},
    {"short_payload", test_short_payload},
    {"tampered_ticket", test_tampered_ticket},
    {"wrong_sender_identity", test_wrong_sender_identity},
    {"identity_with_separator_rejected", test_identity_with_separator_rejected},
    {"blob_address_text", test_blob_address_text},
    {"plaintext_with_metadata", test_plaintext_with_metadata},
    {"legacy_plaintext", test_legacy_plaintext},
    {"malformed_plaintext", test_malformed_plaintext}
  };
  return vegam::test::run_test_cases("ticket", tests, argc, argv);
}
