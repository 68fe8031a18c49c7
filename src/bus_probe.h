#pragma once
// bus_probe.h - One-shot scan of the shared bus

#include <stdint.h>

#include "bus_session.h"

namespace multitof {

// Result of an empty write to one address
enum class Ack : uint8_t { PRESENT, ABSENT, BUS_ERROR };

// TwoWire::endTransmission(): 0 ok, 1 too long, 2 NACK on address,
// 3 NACK on data, 4 other error, 5 timeout (ESP32 core)
Ack ackFromWireCode(uint8_t code);

// 0 is the general call address and is never probed, so a device sitting at
// 0x00 is never reported busy.
constexpr uint8_t SCAN_FIRST_ADDRESS = 1;
constexpr uint8_t SCAN_LAST_ADDRESS = 127;

// Probes SCAN_FIRST_ADDRESS..SCAN_LAST_ADDRESS in order. A BUS_ERROR stops the
// sweep and leaves `found` empty.
template <typename ProbeFn>
Status sweepAddresses(ProbeFn probe, AddressSet& found) {
  found.clear();
  for (int addr = SCAN_FIRST_ADDRESS; addr <= SCAN_LAST_ADDRESS; addr++) {
    Ack ack = probe((uint8_t)addr);
    if (ack == Ack::PRESENT) {
      found.insert((uint8_t)addr);
    } else if (ack == Ack::BUS_ERROR) {
      found.clear();
      return Status::transport("bus error during scan");
    }
  }
  return Status::ok();
}

class BusProbe {
public:
  explicit BusProbe(BusSession& session) : _session(session) {}

  // Snapshot of the addresses answering right now. On a transport error
  // `found` is left empty.
  Status scan(AddressSet& found);

private:
  BusSession& _session;
};

}  // namespace multitof
