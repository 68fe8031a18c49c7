// bus_session.cpp
#include "bus_session.h"

#include <utility>

namespace multitof {

BusSession::BusSession(std::unique_ptr<BusTransport> bus, std::unique_ptr<EnableControl> pins)
  : _bus(std::move(bus)), _pins(std::move(pins)) {}

}  // namespace multitof
