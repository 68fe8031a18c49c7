#pragma once
// config.h - Sequencer constants and the runtime configuration surface

#include <stdint.h>
#include <vector>

#include "hal.h"
#include "status.h"

// ===================== BUILD-TIME DEFAULTS =====================
// Factory address of every VL6180X after reset
#ifndef MULTITOF_DEFAULT_ADDRESS
  #define MULTITOF_DEFAULT_ADDRESS 0x29
#endif
// Settle time after releasing a device from reset. Writing to it earlier
// gets NACKed (Remote I/O error on the first register write).
#ifndef MULTITOF_BOOTSTRAP_DELAY_MS
  #define MULTITOF_BOOTSTRAP_DELAY_MS 100
#endif

namespace multitof {

constexpr int DEFAULT_ADDRESS = MULTITOF_DEFAULT_ADDRESS;
constexpr uint32_t BOOTSTRAP_DELAY_MS = MULTITOF_BOOTSTRAP_DELAY_MS;

constexpr int MAX_I2C_ADDRESS = 127;
constexpr int MIN_OFFSET = -128;   // SYSRANGE__PART_TO_PART_RANGE_OFFSET is int8
constexpr int MAX_OFFSET = 127;

// VL6180X I2C_SLAVE__DEVICE_ADDRESS
constexpr uint16_t REG_SUBORDINATE_ADDRESS = 0x212;

// One physical sensor. List order is enable order.
struct DeviceSpec {
  int enable_line;
  uint8_t target_address;
  int8_t offset;
};

struct MultiSensorConfig {
  std::vector<int> enable_lines;
  std::vector<int> addresses;
  std::vector<int> offsets;          // empty = zero for every device
  PinScheme scheme = PinScheme::GPIO;
  int default_address = DEFAULT_ADDRESS;
  uint32_t bootstrap_delay_ms = BOOTSTRAP_DELAY_MS;
};

bool isValidAddress(int addr);

// Checks lengths, address and offset ranges, pin numbers and the scheme, then
// zips the parallel lists into `out`. Touches no hardware.
Status buildDeviceSpecs(const MultiSensorConfig& cfg, std::vector<DeviceSpec>& out);

}  // namespace multitof
