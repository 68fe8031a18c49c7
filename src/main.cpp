// main.cpp - Multi VL6180X ranging on a single I2C bus
#include <Arduino.h>
#include <Wire.h>
#include <Adafruit_VL6180X.h>

#include <memory>

#include "multi_sensor.h"
#include "arduino/gpio_enable.h"
#include "arduino/serial_log.h"
#include "arduino/wire_bus.h"

using namespace multitof;

// ===================== PINS =====================
constexpr int PIN_SDA = 21;
constexpr int PIN_SCL = 22;
constexpr uint32_t I2C_CLOCK_HZ = 100000;  // 100kHz for stability

// VL6180X CE (GPIO0) map, one line per sensor. Enable order = table order.
// AVOID: 0, 2, 15 (boot pins), 6-11 (flash), 34-39 (input only)
struct SensorCfg { const char* role; int ce_pin; uint8_t addr; int8_t offset; };
SensorCfg g_cfgs[] = {
  { "Left",    25, 0x30, 100 },
  { "Forward", 26, 0x31, 100 },
  { "Right",   27, 0x32, 100 },
};
constexpr size_t NUM_SENSORS = sizeof(g_cfgs)/sizeof(g_cfgs[0]);

// ===================== TIMING =====================
constexpr uint32_t PRINT_PERIOD_MS = 40;
constexpr uint32_t LUX_PERIOD_MS = 10000;

// ===================== GLOBAL STATE =====================
static SerialLog g_log(Serial);
static MultiSensor g_tof(std::unique_ptr<BusTransport>(new WireBus(Wire)),
                         std::unique_ptr<EnableControl>(new GpioEnable()),
                         g_log);

uint32_t g_last_print_ms = 0, g_last_lux_ms = 0;

const char* roleFor(const SequencedDevice& s) {
  return s.index() < NUM_SENSORS ? g_cfgs[s.index()].role : "?";
}

MultiSensorConfig buildConfig() {
  MultiSensorConfig cfg;
  for (size_t i = 0; i < NUM_SENSORS; i++) {
    cfg.enable_lines.push_back(g_cfgs[i].ce_pin);
    cfg.addresses.push_back(g_cfgs[i].addr);
    cfg.offsets.push_back(g_cfgs[i].offset);
  }
  cfg.scheme = PinScheme::GPIO;
  return cfg;
}

// ===================== SETUP =====================
void setup() {
  Serial.begin(115200);
  delay(2000);

  Serial.println("\n========================================");
  Serial.println("Multi VL6180X on one I2C bus");
  Serial.println("========================================\n");

  Serial.printf("[INIT] I2C: SDA=%d, SCL=%d @ %lu Hz\n", PIN_SDA, PIN_SCL, (unsigned long)I2C_CLOCK_HZ);
  Wire.begin(PIN_SDA, PIN_SCL);
  Wire.setClock(I2C_CLOCK_HZ);
  delay(50);

  Serial.printf("[INIT] Sequencing %u sensors (bootstrap 0x%02X, %lu ms settle)...\n",
    (unsigned)NUM_SENSORS, DEFAULT_ADDRESS, (unsigned long)BOOTSTRAP_DELAY_MS);
  Status st = g_tof.begin(buildConfig());
  if (!st.isOk()) {
    Serial.printf("[ERROR] Sensor table rejected: %s\n", st.message);
  } else if (g_tof.sensorCount() < NUM_SENSORS) {
    Serial.printf("[WARNING] Only %u of %u sensors came up\n",
      (unsigned)g_tof.sensorCount(), (unsigned)NUM_SENSORS);
  } else {
    Serial.println("[OK] All VL6180X sensors initialized");
  }

  for (size_t i = 0; i < g_tof.sensorCount(); i++) {
    SequencedDevice* s = g_tof.sensor((int)i);
    Serial.printf("  %s @ 0x%02X (offset %d)\n", roleFor(*s), s->address(), (int)s->offset());
  }

  g_last_print_ms = millis();
  g_last_lux_ms = millis();
}

// ===================== LOOP =====================
void loop() {
  uint32_t now = millis();

  if (now - g_last_print_ms >= PRINT_PERIOD_MS) {
    g_last_print_ms = now;
    uint32_t t0 = micros();

    Serial.print("\r");
    for (size_t i = 0; i < g_tof.sensorCount(); i++) {
      uint8_t mm = 0, status = 0;
      bool ok = g_tof.getRange((int)i, mm) && g_tof.getRangeStatus((int)i, status);
      if (ok && status == VL6180X_ERROR_NONE) {
        Serial.printf("Sensor %u: %3u | ", (unsigned)i, mm);
      } else {
        Serial.printf("Sensor %u: --- | ", (unsigned)i);
      }
    }
    Serial.printf("Duration: %.5f        ", (micros() - t0) * 1e-6f);
  }

  if (now - g_last_lux_ms >= LUX_PERIOD_MS) {
    g_last_lux_ms = now;
    Serial.println();
    for (size_t i = 0; i < g_tof.sensorCount(); i++) {
      float lux = 0;
      if (g_tof.getLux((int)i, VL6180X_ALS_GAIN_5, lux)) {
        Serial.printf("[Heartbeat] %s: %.1f lux\n", roleFor(*g_tof.sensor((int)i)), lux);
      }
    }
  }

  delay(1);
}
