// sequenced_device.cpp - Reads delegate to the handle under the bus lock
#include "sequenced_device.h"

#include <utility>

namespace multitof {

SequencedDevice::SequencedDevice(BusSession& session, std::unique_ptr<SensorHandle> handle,
                                 int8_t offset, size_t index)
  : _session(&session), _handle(std::move(handle)), _offset(offset), _index(index) {}

Status SequencedDevice::readRange(uint8_t& mm) {
  std::unique_lock<std::recursive_mutex> guard = _session->lock();
  return _handle->readRange(mm);
}

Status SequencedDevice::readRangeStatus(uint8_t& status) {
  std::unique_lock<std::recursive_mutex> guard = _session->lock();
  return _handle->readRangeStatus(status);
}

Status SequencedDevice::readLux(uint8_t gain, float& lux) {
  std::unique_lock<std::recursive_mutex> guard = _session->lock();
  return _handle->readLux(gain, lux);
}

}  // namespace multitof
