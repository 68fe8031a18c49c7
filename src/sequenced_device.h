#pragma once
// sequenced_device.h - A sensor live at its final address

#include <stddef.h>
#include <stdint.h>
#include <memory>

#include "bus_session.h"

namespace multitof {

class SequencedDevice {
public:
  SequencedDevice(BusSession& session, std::unique_ptr<SensorHandle> handle,
                  int8_t offset, size_t index);

  SequencedDevice(SequencedDevice&&) = default;
  SequencedDevice& operator=(SequencedDevice&&) = default;

  uint8_t address() const { return _handle->address(); }
  int8_t offset() const { return _offset; }
  // Position of this device in the configuration it was sequenced from.
  size_t index() const { return _index; }

  Status readRange(uint8_t& mm);
  Status readRangeStatus(uint8_t& status);
  Status readLux(uint8_t gain, float& lux);

private:
  BusSession* _session;
  std::unique_ptr<SensorHandle> _handle;
  int8_t _offset;
  size_t _index;
};

}  // namespace multitof
