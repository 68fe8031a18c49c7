// log_sink.cpp
#include "log_sink.h"

#include <stdarg.h>
#include <stdio.h>

namespace multitof {

void LogSink::printf(const char* fmt, ...) {
  char buf[192];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  write(buf);
}

}  // namespace multitof
