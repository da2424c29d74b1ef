#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  Format,
  Encoding,
  Crypto,
  Network,
  Io,
  NotInitialized,
  InvalidTicket
};

inline const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Format: return "FormatError";
    case ErrorKind::Encoding: return "EncodingError";
    case ErrorKind::Crypto: return "CryptoError";
    case ErrorKind::Network: return "NetworkError";
    case ErrorKind::Io: return "IoError";
    case ErrorKind::NotInitialized: return "NotInitialized";
    case ErrorKind::InvalidTicket: return "InvalidTicket";
  }
  return "UnknownError";
}

class VegamError : public std::runtime_error {
public:
  VegamError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class FormatError : public VegamError {
public:
  explicit FormatError(const std::string& message) : VegamError(ErrorKind::Format, message) {}
};

class EncodingError : public VegamError {
public:
  explicit EncodingError(const std::string& message) : VegamError(ErrorKind::Encoding, message) {}
};

class CryptoError : public VegamError {
public:
  explicit CryptoError(const std::string& message) : VegamError(ErrorKind::Crypto, message) {}
};

class NetworkError : public VegamError {
public:
  explicit NetworkError(const std::string& message) : VegamError(ErrorKind::Network, message) {}
};

class IoError : public VegamError {
public:
  explicit IoError(const std::string& message) : VegamError(ErrorKind::Io, message) {}
};

class NotInitialized : public VegamError {
public:
  explicit NotInitialized(const std::string& message) : VegamError(ErrorKind::NotInitialized, message) {}
};

// Raised by the receive path for any codec or parsing failure; cause() keeps
// the underlying kind so callers can still tell a tampered ticket from a typo.
class InvalidTicket : public VegamError {
public:
  InvalidTicket(const std::string& message, ErrorKind cause)
    : VegamError(ErrorKind::InvalidTicket, message), cause_(cause) {}

  ErrorKind cause() const { return cause_; }

private:
  ErrorKind cause_;
};
