// wire_bus.cpp - I2C transactions for the sequencer and the sensor reads
#include "wire_bus.h"

#include "../bus_probe.h"

using multitof::Status;

// ===================== VL6180X HANDLE =====================
Vl6180xHandle::Vl6180xHandle(TwoWire& wire, Adafruit_VL6180X& vl, uint8_t address)
  : _wire(wire), _vl(vl), _address(address) {}

bool Vl6180xHandle::begin(int8_t offset) {
  if (!_vl.begin(&_wire)) return false;
  _vl.setOffset((uint8_t)offset);  // register is two's complement
  return true;
}

// Empty write; 0 from endTransmission means the address was ACKed.
bool Vl6180xHandle::acked() {
  _wire.beginTransmission(_address);
  return multitof::ackFromWireCode(_wire.endTransmission()) == multitof::Ack::PRESENT;
}

// VL6180X registers are 16-bit, MSB first
Status Vl6180xHandle::writeRegister(uint16_t reg, uint8_t value) {
  _wire.beginTransmission(_address);
  _wire.write((uint8_t)(reg >> 8));
  _wire.write((uint8_t)(reg & 0xFF));
  _wire.write(value);
  if (_wire.endTransmission() != 0) {
    return Status::transport("register write not acknowledged");
  }
  return Status::ok();
}

Status Vl6180xHandle::readRange(uint8_t& mm) {
  if (!acked()) return Status::transport("sensor not answering");
  mm = _vl.readRange();
  return Status::ok();
}

Status Vl6180xHandle::readRangeStatus(uint8_t& status) {
  if (!acked()) return Status::transport("sensor not answering");
  status = _vl.readRangeStatus();
  return Status::ok();
}

Status Vl6180xHandle::readLux(uint8_t gain, float& lux) {
  if (!acked()) return Status::transport("sensor not answering");
  lux = _vl.readLux(gain);
  return Status::ok();
}

// ===================== BUS =====================
Status WireBus::scan(multitof::AddressSet& found) {
  TwoWire& wire = _wire;
  return multitof::sweepAddresses([&wire](uint8_t addr) {
    wire.beginTransmission(addr);
    return multitof::ackFromWireCode(wire.endTransmission());
  }, found);
}

Status WireBus::open(uint8_t address, int8_t offset, std::unique_ptr<multitof::SensorHandle>& out) {
  std::unique_ptr<Vl6180xHandle> h(new Vl6180xHandle(_wire, _drivers.at(address), address));
  if (!h->begin(offset)) {
    return Status::transport("no VL6180X answering at address");
  }
  out.reset(h.release());
  return Status::ok();
}
