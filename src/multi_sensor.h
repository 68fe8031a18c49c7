#pragma once
// multi_sensor.h - Several identical VL6180X sensors on one I2C bus
//
// Usage:
//   MultiSensor tof(std::move(bus), std::move(pins), log);
//   MultiSensorConfig cfg;
//   cfg.enable_lines = {10, 9, 11};
//   cfg.addresses    = {0x30, 0x31, 0x32};
//   cfg.offsets      = {100, 100, 100};
//   tof.begin(cfg);
//   uint8_t mm;
//   if (tof.getRange(0, mm)) { ... }

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <vector>

#include "address_sequencer.h"
#include "bus_session.h"
#include "config.h"
#include "log_sink.h"
#include "sequenced_device.h"

namespace multitof {

class MultiSensor {
public:
  MultiSensor(std::unique_ptr<BusTransport> bus, std::unique_ptr<EnableControl> pins, LogSink& log);

  // Validates `cfg` and sequences the sensors. Returns a configuration error
  // (no hardware touched) or ok; sensors that failed are just missing from
  // the collection, see report().
  Status begin(const MultiSensorConfig& cfg);

  size_t sensorCount() const { return _sensors.size(); }
  SequencedDevice* sensor(int idx);
  const SequenceReport& report() const { return _report; }

  // Strict queries: QUERY for a bad index, TRANSPORT from the device.
  Status readRange(int idx, uint8_t& mm);
  Status readRangeStatus(int idx, uint8_t& status);
  Status readLux(int idx, uint8_t gain, float& lux);

  // Lenient queries: false (and a log line) for any failure.
  bool getRange(int idx, uint8_t& mm);
  bool getRangeStatus(int idx, uint8_t& status);
  bool getLux(int idx, uint8_t gain, float& lux);

private:
  void logReport();
  bool logQueryFailure(int idx, const char* what, const Status& st);

  BusSession _session;
  LogSink& _log;
  std::vector<SequencedDevice> _sensors;
  SequenceReport _report;
};

}  // namespace multitof
