#pragma once
// log_sink.h - printf-style log output supplied by the caller

namespace multitof {

class LogSink {
public:
  virtual ~LogSink() {}

  // Formats into a fixed line buffer (truncating) and hands it to write().
  void printf(const char* fmt, ...);

protected:
  virtual void write(const char* line) = 0;
};

}  // namespace multitof
