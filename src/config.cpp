// config.cpp - Configuration validation
#include "config.h"

namespace multitof {

bool isKnownScheme(PinScheme scheme) {
  return scheme == PinScheme::GPIO || scheme == PinScheme::BOARD;
}

bool isValidAddress(int addr) {
  return addr >= 0 && addr <= MAX_I2C_ADDRESS;
}

Status buildDeviceSpecs(const MultiSensorConfig& cfg, std::vector<DeviceSpec>& out) {
  out.clear();

  const size_t n = cfg.enable_lines.size();
  if (cfg.addresses.size() != n) {
    return Status::configuration("enable lines and addresses must be the same size");
  }
  if (!cfg.offsets.empty() && cfg.offsets.size() != n) {
    return Status::configuration("enable lines and offsets must be the same size");
  }
  if (!isKnownScheme(cfg.scheme)) {
    return Status::configuration("pin scheme must be GPIO or BOARD");
  }
  if (!isValidAddress(cfg.default_address)) {
    return Status::configuration("default address must be in the range 0-127");
  }

  for (size_t i = 0; i < n; i++) {
    if (cfg.enable_lines[i] < 0) {
      return Status::configuration("enable lines must be non-negative pin numbers");
    }
    if (!isValidAddress(cfg.addresses[i])) {
      return Status::configuration("addresses must be in the range 0-127");
    }
    if (!cfg.offsets.empty() && (cfg.offsets[i] < MIN_OFFSET || cfg.offsets[i] > MAX_OFFSET)) {
      return Status::configuration("offsets must be in the range -128..127");
    }
  }

  out.reserve(n);
  for (size_t i = 0; i < n; i++) {
    DeviceSpec d;
    d.enable_line = cfg.enable_lines[i];
    d.target_address = static_cast<uint8_t>(cfg.addresses[i]);
    d.offset = cfg.offsets.empty() ? 0 : static_cast<int8_t>(cfg.offsets[i]);
    out.push_back(d);
  }
  return Status::ok();
}

}  // namespace multitof
