#pragma once
// wire_bus.h - BusTransport over Arduino TwoWire, VL6180X handles via Adafruit_VL6180X

#include <Arduino.h>
#include <Wire.h>
#include <Adafruit_VL6180X.h>

#include "../address_pool.h"
#include "../hal.h"

class Vl6180xHandle : public multitof::SensorHandle {
public:
  // `vl` is the pooled driver for `address`, owned by the WireBus.
  Vl6180xHandle(TwoWire& wire, Adafruit_VL6180X& vl, uint8_t address);

  // Runs the driver's begin() (model id check + settings load) and applies
  // the part-to-part range offset.
  bool begin(int8_t offset);

  uint8_t address() const override { return _address; }

  multitof::Status writeRegister(uint16_t reg, uint8_t value) override;
  multitof::Status readRange(uint8_t& mm) override;
  multitof::Status readRangeStatus(uint8_t& status) override;
  multitof::Status readLux(uint8_t gain, float& lux) override;

private:
  bool acked();

  TwoWire& _wire;
  Adafruit_VL6180X& _vl;
  uint8_t _address;
};

class WireBus : public multitof::BusTransport {
public:
  explicit WireBus(TwoWire& wire) : _wire(wire) {}

  multitof::Status scan(multitof::AddressSet& found) override;
  multitof::Status open(uint8_t address, int8_t offset,
                        std::unique_ptr<multitof::SensorHandle>& out) override;

private:
  TwoWire& _wire;
  multitof::AddressPool<Adafruit_VL6180X> _drivers;
};
