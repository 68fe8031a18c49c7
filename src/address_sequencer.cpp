// address_sequencer.cpp
#include "address_sequencer.h"

#include <utility>

#include "bus_probe.h"

namespace multitof {

const char* deviceStateName(DeviceState state) {
  switch (state) {
    case DeviceState::RESET:        return "RESET";
    case DeviceState::ENABLING:     return "ENABLING";
    case DeviceState::BOOTSTRAPPED: return "BOOTSTRAPPED";
    case DeviceState::REASSIGNED:   return "REASSIGNED";
    case DeviceState::READY:        return "READY";
    case DeviceState::FAILED:       return "FAILED";
  }
  return "?";
}

size_t SequenceReport::readyCount() const {
  size_t n = 0;
  for (size_t i = 0; i < outcomes.size(); i++) {
    if (outcomes[i].state == DeviceState::READY) n++;
  }
  return n;
}

size_t SequenceReport::failedCount() const {
  size_t n = 0;
  for (size_t i = 0; i < outcomes.size(); i++) {
    if (outcomes[i].state == DeviceState::FAILED) n++;
  }
  return n;
}

Status AddressSequencer::checkPreconditions(const std::vector<DeviceSpec>& devices,
                                            int default_address, PinScheme scheme) {
  if (!isValidAddress(default_address)) {
    return Status::configuration("default address must be in the range 0-127");
  }
  if (!isKnownScheme(scheme) || !_session.pins().supports(scheme)) {
    return Status::configuration("pin scheme not supported by the enable-line backend");
  }
  for (size_t i = 0; i < devices.size(); i++) {
    if (!isValidAddress(devices[i].target_address)) {
      return Status::configuration("addresses must be in the range 0-127");
    }
    if (devices[i].enable_line < 0) {
      return Status::configuration("enable lines must be non-negative pin numbers");
    }
  }
  return Status::ok();
}

void AddressSequencer::holdAllInReset(const std::vector<DeviceSpec>& devices, PinScheme scheme) {
  EnableControl& pins = _session.pins();
  pins.setMode(scheme);
  for (size_t i = 0; i < devices.size(); i++) {
    pins.deassertLine(devices[i].enable_line);
  }
}

void AddressSequencer::reassign(DeviceOutcome& o, uint8_t default_address,
                                uint32_t bootstrap_delay_ms) {
  EnableControl& pins = _session.pins();

  o.state = DeviceState::ENABLING;
  pins.assertLine(o.spec.enable_line);
  pins.delayMs(bootstrap_delay_ms);

  // Temporary handle; only this device answers at the default address now.
  std::unique_ptr<SensorHandle> temp;
  Status st = _session.bus().open(default_address, 0, temp);
  if (!st.isOk()) {
    o.failed_in = o.state;
    o.state = DeviceState::FAILED;
    o.error = st;
    return;
  }
  o.state = DeviceState::BOOTSTRAPPED;

  st = temp->writeRegister(REG_SUBORDINATE_ADDRESS, o.spec.target_address);
  if (!st.isOk()) {
    // Enable line stays HIGH; the device may still sit at the default address.
    o.failed_in = o.state;
    o.state = DeviceState::FAILED;
    o.error = st;
    return;
  }
  o.state = DeviceState::REASSIGNED;
}

void AddressSequencer::attach(DeviceOutcome& o, size_t index, std::vector<SequencedDevice>& out) {
  std::unique_ptr<SensorHandle> handle;
  Status st = _session.bus().open(o.spec.target_address, o.spec.offset, handle);
  if (!st.isOk()) {
    o.failed_in = o.state;
    o.state = DeviceState::FAILED;
    o.error = st;
    return;
  }
  out.push_back(SequencedDevice(_session, std::move(handle), o.spec.offset, index));
  o.state = DeviceState::READY;
}

Status AddressSequencer::initialize(const std::vector<DeviceSpec>& devices,
                                    int default_address,
                                    uint32_t bootstrap_delay_ms,
                                    PinScheme scheme,
                                    std::vector<SequencedDevice>& out,
                                    SequenceReport& report) {
  out.clear();
  report = SequenceReport();

  Status st = checkPreconditions(devices, default_address, scheme);
  if (!st.isOk()) return st;

  std::unique_lock<std::recursive_mutex> guard = _session.lock();

  holdAllInReset(devices, scheme);

  BusProbe probe(_session);
  report.probe = probe.scan(report.busy);

  report.outcomes.reserve(devices.size());
  for (size_t i = 0; i < devices.size(); i++) {
    DeviceOutcome o;
    o.spec = devices[i];
    o.state = DeviceState::RESET;
    o.already_live = report.busy.count(devices[i].target_address) != 0;
    o.failed_in = DeviceState::RESET;
    report.outcomes.push_back(o);
  }

  // Pending devices, strictly one at a time in input order
  const uint8_t boot_addr = static_cast<uint8_t>(default_address);
  for (size_t i = 0; i < report.outcomes.size(); i++) {
    DeviceOutcome& o = report.outcomes[i];
    if (o.already_live) continue;
    reassign(o, boot_addr, bootstrap_delay_ms);
  }

  // Final handles at the target addresses, input order preserved
  for (size_t i = 0; i < report.outcomes.size(); i++) {
    DeviceOutcome& o = report.outcomes[i];
    if (o.state == DeviceState::FAILED) continue;
    attach(o, i, out);
  }

  return Status::ok();
}

}  // namespace multitof
