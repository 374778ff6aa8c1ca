// Light sensors and relays wired to the Raspberry Pi's GPIO header,
// driven through the bcm2835 library.
//
// Each light has a digital LDR module on an input pin (LOW = dark,
// HIGH = bright) and a relay on an output pin. The relay board is
// active-low: the relay closes when the pin is driven LOW.

#ifndef _STREETLIGHT_HARDWARE_SENSOR_RELAY_H
#define _STREETLIGHT_HARDWARE_SENSOR_RELAY_H

#include <array>
#include <cstdint>

#include "lights.h"
#include "sensor-relay.h"

struct HardwareSensorRelay : public SensorRelay {
  // BCM pin numbers, indexed by light. Initializes the peripheral
  // and turns every relay off. If initialization fails (not root?
  // not a Pi?) the object is still usable, but every read is a
  // fault and every write fails.
  HardwareSensorRelay(const std::array<int, NUM_LIGHTS> &relay_pins,
                      const std::array<int, NUM_LIGHTS> &ldr_pins);
  // Turns every relay off and releases the peripheral.
  ~HardwareSensorRelay() override;

  const char *Name() const override { return "hardware"; }
  Ambient ReadAmbient(int idx) override;
  bool SetRelay(int idx, bool on) override;
  // 0 when dark, 100 when bright. The LDR modules are binary.
  int SampleLux(bool dark) override;

  bool Ok() const { return ok; }

  // Pin levels, as bcm2835's LOW and HIGH.
  static constexpr uint8_t LEVEL_LOW = 0;
  static constexpr uint8_t LEVEL_HIGH = 1;

  // Level to drive a relay's pin for the logical state. The relay
  // board is active-low.
  static constexpr uint8_t RelayLevel(bool on) {
    return on ? LEVEL_LOW : LEVEL_HIGH;
  }

  // Whether an LDR pin's level means dark.
  static constexpr bool LevelIsDark(uint8_t level) {
    return level == LEVEL_LOW;
  }

private:
  const std::array<int, NUM_LIGHTS> relay_pins, ldr_pins;
  bool ok = false;
};

#endif
