#pragma once
// hal.h - Hardware capabilities consumed by the sequencer
//
// The core never touches pins or the bus directly. A board binding (see
// src/arduino/) or a test fake implements these.

#include <stdint.h>
#include <set>
#include <memory>

#include "status.h"

namespace multitof {

typedef std::set<uint8_t> AddressSet;

// How enable-line identifiers are interpreted.
//   GPIO  - native GPIO numbers (ESP32 GPIOxx, BCM on a Pi)
//   BOARD - physical header pin numbers
enum class PinScheme : uint8_t { GPIO = 0, BOARD = 1 };

bool isKnownScheme(PinScheme scheme);

// ===================== ENABLE LINES =====================
class EnableControl {
public:
  virtual ~EnableControl() {}

  virtual bool supports(PinScheme scheme) const = 0;
  virtual void setMode(PinScheme scheme) = 0;

  // HIGH releases the device from reset, LOW holds it.
  virtual void assertLine(int line) = 0;
  virtual void deassertLine(int line) = 0;

  // Blocking wait; used for the bootstrap settle time.
  virtual void delayMs(uint32_t ms) = 0;
};

// ===================== SENSOR HANDLE =====================
// A device opened at one fixed address on the shared bus.
class SensorHandle {
public:
  virtual ~SensorHandle() {}

  virtual uint8_t address() const = 0;

  virtual Status writeRegister(uint16_t reg, uint8_t value) = 0;
  virtual Status readRange(uint8_t& mm) = 0;
  virtual Status readRangeStatus(uint8_t& status) = 0;
  virtual Status readLux(uint8_t gain, float& lux) = 0;
};

// ===================== BUS TRANSPORT =====================
class BusTransport {
public:
  virtual ~BusTransport() {}

  virtual Status scan(AddressSet& found) = 0;

  // Fails with a transport error when nothing answers at `address`.
  virtual Status open(uint8_t address, int8_t offset, std::unique_ptr<SensorHandle>& out) = 0;
};

}  // namespace multitof
