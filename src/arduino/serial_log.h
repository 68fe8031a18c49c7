#pragma once
// serial_log.h - LogSink printing whole lines to a Print (normally Serial)

#include <Arduino.h>

#include "../log_sink.h"

class SerialLog : public multitof::LogSink {
public:
  explicit SerialLog(Print& out) : _out(out) {}

protected:
  void write(const char* line) override { _out.println(line); }

private:
  Print& _out;
};
