#pragma once
#include <expected>
#include <string>

namespace mediamgr::model {

enum class ErrorKind {
  Discovery,        // device or partition failed to enumerate
  DuplicateSerial,  // serial reused within a group, or rejected across groups
  GroupNotFound,    // edit/remove referenced an unknown group id
  Persistence,      // write or reload failed
  Malformed,        // configuration content is structurally invalid
  InvalidArgument,  // caller passed an empty name or serial
};

struct StorageError {
  ErrorKind kind{ErrorKind::Persistence};
  std::string message;
  std::string group_id;  // offending or conflicting group, when known
  std::string serial;    // offending serial, when known
};

template <typename T>
using Result = std::expected<T, StorageError>;

[[nodiscard]] inline std::unexpected<StorageError> make_error(ErrorKind kind, std::string message,
                                                              std::string group_id = {},
                                                              std::string serial = {}) {
  return std::unexpected(StorageError{kind, std::move(message), std::move(group_id), std::move(serial)});
}

[[nodiscard]] inline const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::Discovery:       return "DiscoveryError";
    case ErrorKind::DuplicateSerial: return "DuplicateSerialError";
    case ErrorKind::GroupNotFound:   return "GroupNotFoundError";
    case ErrorKind::Persistence:     return "PersistenceError";
    case ErrorKind::Malformed:       return "MalformedConfigError";
    case ErrorKind::InvalidArgument: return "InvalidArgumentError";
  }
  return "StorageError";
}

} // namespace mediamgr::model
