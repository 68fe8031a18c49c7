#pragma once
// status.h - Error kinds and the Status value returned by fallible calls

#include <stdint.h>

namespace multitof {

enum class ErrorKind : uint8_t { NONE, CONFIGURATION, TRANSPORT, QUERY };

// Static message strings only; Status never owns memory.
struct Status {
  ErrorKind kind;
  const char* message;

  Status() : kind(ErrorKind::NONE), message("ok") {}
  Status(ErrorKind k, const char* msg) : kind(k), message(msg) {}

  static Status ok() { return Status(); }
  static Status configuration(const char* msg) { return Status(ErrorKind::CONFIGURATION, msg); }
  static Status transport(const char* msg) { return Status(ErrorKind::TRANSPORT, msg); }
  static Status query(const char* msg) { return Status(ErrorKind::QUERY, msg); }

  bool isOk() const { return kind == ErrorKind::NONE; }
};

const char* errorKindName(ErrorKind kind);

}  // namespace multitof
