#pragma once
// address_sequencer.h - One-at-a-time power-up and address reassignment
//
// Every device of the family boots at the same default address, so they are
// released from reset one by one and moved to their target address before
// the next one is released:
//
//   hold all enable lines LOW
//   scan the bus once (targets already answering are not re-sequenced)
//   for each pending device:
//     enable -> wait bootstrap delay -> open @default -> write target into 0x212
//   open every device expected live @target with its offset
//
// A transport failure only fails that device; the run continues with the rest.

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "bus_session.h"
#include "config.h"
#include "sequenced_device.h"

namespace multitof {

// RESET -> ENABLING -> BOOTSTRAPPED -> REASSIGNED -> READY, or FAILED from any
// transport step. Already-live devices go straight RESET -> READY.
enum class DeviceState : uint8_t { RESET, ENABLING, BOOTSTRAPPED, REASSIGNED, READY, FAILED };

const char* deviceStateName(DeviceState state);

struct DeviceOutcome {
  DeviceSpec spec;
  DeviceState state;
  bool already_live;
  Status error;         // ok unless state == FAILED
  DeviceState failed_in; // last state reached before the failure
};

struct SequenceReport {
  AddressSet busy;      // probe snapshot
  Status probe;         // a failed probe counts as an empty snapshot
  std::vector<DeviceOutcome> outcomes;  // one per input device, input order

  size_t readyCount() const;
  size_t failedCount() const;
};

class AddressSequencer {
public:
  explicit AddressSequencer(BusSession& session) : _session(session) {}

  // Only configuration errors are returned; per-device failures end up in
  // `report` and the device is left out of `out`.
  Status initialize(const std::vector<DeviceSpec>& devices,
                    int default_address,
                    uint32_t bootstrap_delay_ms,
                    PinScheme scheme,
                    std::vector<SequencedDevice>& out,
                    SequenceReport& report);

private:
  Status checkPreconditions(const std::vector<DeviceSpec>& devices,
                            int default_address, PinScheme scheme);
  void holdAllInReset(const std::vector<DeviceSpec>& devices, PinScheme scheme);
  void reassign(DeviceOutcome& o, uint8_t default_address, uint32_t bootstrap_delay_ms);
  void attach(DeviceOutcome& o, size_t index, std::vector<SequencedDevice>& out);

  BusSession& _session;
};

}  // namespace multitof
