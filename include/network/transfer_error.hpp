#ifndef UPSTREAM_NETWORK_TRANSFER_ERROR_HPP
#define UPSTREAM_NETWORK_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace upstream::network {

class TransferError : public std::runtime_error {
public:
  explicit TransferError(const std::string& message)
    : std::runtime_error(message) {}
};

// Local file problem: a failed precondition, checked before any request,
// or an I/O failure while reading or writing a shard
class FileError : public TransferError {
public:
  enum class Kind {
    NotFound,
    Empty,
    AlreadyExists,
    InvalidDirectory,
    Io
  };

  FileError(Kind kind, const std::string& message)
    : TransferError(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

// Server unreachable, or the connection broke mid-transfer
class ConnectError : public TransferError {
public:
  explicit ConnectError(const std::string& message)
    : TransferError(message) {}
};

// Remote API answered with a status the client does not accept
class ResponseError : public TransferError {
public:
  ResponseError(const std::string& message, unsigned status,
                const std::string& reason, const std::string& body)
    : TransferError(message)
    , status_(status)
    , reason_(reason)
    , body_(body) {}

  unsigned status() const { return status_; }
  const std::string& reason() const { return reason_; }
  const std::string& body() const { return body_; }

private:
  unsigned status_;
  std::string reason_;
  std::string body_;
};

// Shard lacks the hash needed to address a download
class ChunkError : public TransferError {
public:
  explicit ChunkError(const std::string& message = "Shard has no content hash")
    : TransferError(message) {}
};

inline const char* file_error_kind_to_string(FileError::Kind kind) {
  switch (kind) {
    case FileError::Kind::NotFound: return "Not found";
    case FileError::Kind::Empty: return "Empty file";
    case FileError::Kind::AlreadyExists: return "Already exists";
    case FileError::Kind::InvalidDirectory: return "Invalid directory";
    case FileError::Kind::Io: return "I/O failure";
    default: return "Undefined error";
  }
}

} // namespace upstream::network

#endif // UPSTREAM_NETWORK_TRANSFER_ERROR_HPP
