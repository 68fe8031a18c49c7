// bus_probe.cpp
#include "bus_probe.h"

namespace multitof {

Ack ackFromWireCode(uint8_t code) {
  switch (code) {
    case 0:  return Ack::PRESENT;
    case 4:
    case 5:  return Ack::BUS_ERROR;
    default: return Ack::ABSENT;
  }
}

Status BusProbe::scan(AddressSet& found) {
  found.clear();
  std::unique_lock<std::recursive_mutex> guard = _session.lock();
  Status st = _session.bus().scan(found);
  if (!st.isOk()) found.clear();
  return st;
}

}  // namespace multitof
