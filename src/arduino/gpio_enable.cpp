// gpio_enable.cpp
#include "gpio_enable.h"

void GpioEnable::assertLine(int line) {
  pinMode(line, OUTPUT);
  digitalWrite(line, HIGH);
}

void GpioEnable::deassertLine(int line) {
  pinMode(line, OUTPUT);
  digitalWrite(line, LOW);
}
