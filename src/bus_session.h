#pragma once
// bus_session.h - Owned bus + enable-line resources and the bus lock

#include <memory>
#include <mutex>

#include "hal.h"

namespace multitof {

// Every bus transaction runs under lock(). The lock is recursive so the
// sequencer can hold it for a whole run while the probe and handles take it
// per transaction.
class BusSession {
public:
  BusSession(std::unique_ptr<BusTransport> bus, std::unique_ptr<EnableControl> pins);

  BusSession(const BusSession&) = delete;
  BusSession& operator=(const BusSession&) = delete;

  BusTransport& bus() { return *_bus; }
  EnableControl& pins() { return *_pins; }

  std::unique_lock<std::recursive_mutex> lock() {
    return std::unique_lock<std::recursive_mutex>(_mutex);
  }

private:
  std::unique_ptr<BusTransport> _bus;
  std::unique_ptr<EnableControl> _pins;
  std::recursive_mutex _mutex;
};

}  // namespace multitof
