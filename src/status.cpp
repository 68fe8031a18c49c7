// status.cpp - Error kind names for log output
#include "status.h"

namespace multitof {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:          return "ok";
    case ErrorKind::CONFIGURATION: return "configuration error";
    case ErrorKind::TRANSPORT:     return "transport error";
    case ErrorKind::QUERY:         return "query error";
  }
  return "unknown error";
}

}  // namespace multitof
