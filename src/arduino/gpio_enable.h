#pragma once
// gpio_enable.h - Enable lines on native GPIO pins (XSHUT / CE)

#include <Arduino.h>

#include "../hal.h"

// Arduino cores address pins by GPIO number only; BOARD numbering is rejected
// by the sequencer before any pin is touched.
class GpioEnable : public multitof::EnableControl {
public:
  bool supports(multitof::PinScheme scheme) const override {
    return scheme == multitof::PinScheme::GPIO;
  }
  // Nothing to select, pins are always GPIO numbers here
  void setMode(multitof::PinScheme) override {}

  void assertLine(int line) override;
  void deassertLine(int line) override;
  void delayMs(uint32_t ms) override { delay(ms); }
};
