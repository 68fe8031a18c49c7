// multi_sensor.cpp
#include "multi_sensor.h"

#include <stdio.h>
#include <utility>

namespace multitof {

MultiSensor::MultiSensor(std::unique_ptr<BusTransport> bus, std::unique_ptr<EnableControl> pins,
                         LogSink& log)
  : _session(std::move(bus), std::move(pins)), _log(log) {}

Status MultiSensor::begin(const MultiSensorConfig& cfg) {
  _sensors.clear();
  _report = SequenceReport();

  std::vector<DeviceSpec> devices;
  Status st = buildDeviceSpecs(cfg, devices);
  if (!st.isOk()) {
    _log.printf("[TOF] Initialization error: %s", st.message);
    return st;
  }

  AddressSequencer sequencer(_session);
  st = sequencer.initialize(devices, cfg.default_address, cfg.bootstrap_delay_ms, cfg.scheme,
                            _sensors, _report);
  if (!st.isOk()) {
    _log.printf("[TOF] Initialization error: %s", st.message);
    return st;
  }

  logReport();
  return Status::ok();
}

void MultiSensor::logReport() {
  if (!_report.probe.isOk()) {
    _log.printf("[TOF] Bus scan failed (%s), sequencing every sensor", _report.probe.message);
  }

  char line[128];
  const size_t room = sizeof(line) - 5;  // keep space for ", ..."
  size_t len = 0;
  bool truncated = false;
  line[0] = '\0';
  for (AddressSet::const_iterator it = _report.busy.begin(); it != _report.busy.end(); ++it) {
    int n = snprintf(line + len, room - len, "%s0x%02x", len ? ", " : "", *it);
    if (n < 0 || (size_t)n >= room - len) {
      line[len] = '\0';
      truncated = true;
      break;
    }
    len += n;
  }
  if (truncated) {
    snprintf(line + len, sizeof(line) - len, "%s...", len ? ", " : "");
  }
  _log.printf("[TOF] address i2c detect: %s", (len || truncated) ? line : "(none)");

  for (size_t i = 0; i < _report.outcomes.size(); i++) {
    const DeviceOutcome& o = _report.outcomes[i];
    if (o.already_live) {
      _log.printf("[TOF] 0x%02X already on the bus, skipping line %d", o.spec.target_address,
                  o.spec.enable_line);
    } else {
      _log.printf("[TOF] Create new address 0x%02X on line %d", o.spec.target_address,
                  o.spec.enable_line);
    }
    if (o.state == DeviceState::FAILED) {
      _log.printf("[TOF] !! Error initializing sensor at address 0x%02X and line %d: %s (after %s)",
                  o.spec.target_address, o.spec.enable_line, o.error.message,
                  deviceStateName(o.failed_in));
    } else {
      _log.printf("[OK] Sensor %u @ 0x%02X (line %d, offset %d)", (unsigned)i,
                  o.spec.target_address, o.spec.enable_line, (int)o.spec.offset);
    }
  }
  _log.printf("[TOF] %u/%u sensors ready", (unsigned)_report.readyCount(),
              (unsigned)_report.outcomes.size());
}

SequencedDevice* MultiSensor::sensor(int idx) {
  if (idx < 0 || (size_t)idx >= _sensors.size()) return nullptr;
  return &_sensors[idx];
}

// ===================== STRICT QUERIES =====================
Status MultiSensor::readRange(int idx, uint8_t& mm) {
  SequencedDevice* s = sensor(idx);
  if (!s) return Status::query("invalid sensor index");
  return s->readRange(mm);
}

Status MultiSensor::readRangeStatus(int idx, uint8_t& status) {
  SequencedDevice* s = sensor(idx);
  if (!s) return Status::query("invalid sensor index");
  return s->readRangeStatus(status);
}

Status MultiSensor::readLux(int idx, uint8_t gain, float& lux) {
  SequencedDevice* s = sensor(idx);
  if (!s) return Status::query("invalid sensor index");
  return s->readLux(gain, lux);
}

// ===================== LENIENT QUERIES =====================
bool MultiSensor::logQueryFailure(int idx, const char* what, const Status& st) {
  if (st.kind == ErrorKind::QUERY) {
    _log.printf("[TOF] Invalid sensor index: %d", idx);
  } else {
    _log.printf("[TOF] Error retrieving %s from sensor %d: %s", what, idx, st.message);
  }
  return false;
}

bool MultiSensor::getRange(int idx, uint8_t& mm) {
  Status st = readRange(idx, mm);
  return st.isOk() ? true : logQueryFailure(idx, "range", st);
}

bool MultiSensor::getRangeStatus(int idx, uint8_t& status) {
  Status st = readRangeStatus(idx, status);
  return st.isOk() ? true : logQueryFailure(idx, "range status", st);
}

bool MultiSensor::getLux(int idx, uint8_t gain, float& lux) {
  Status st = readLux(idx, gain, lux);
  return st.isOk() ? true : logQueryFailure(idx, "lux value", st);
}

}  // namespace multitof
