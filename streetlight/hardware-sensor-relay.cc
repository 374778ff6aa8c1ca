#include "hardware-sensor-relay.h"

#include <array>
#include <cstdint>

#include <bcm2835.h>

#include "base/logging.h"

using namespace std;

static_assert(HardwareSensorRelay::LEVEL_LOW == LOW &&
              HardwareSensorRelay::LEVEL_HIGH == HIGH,
              "pin levels must match bcm2835");

HardwareSensorRelay::HardwareSensorRelay(
    const array<int, NUM_LIGHTS> &relay_pins,
    const array<int, NUM_LIGHTS> &ldr_pins) :
  relay_pins(relay_pins), ldr_pins(ldr_pins) {

  if (!bcm2835_init()) {
    LOG(ERROR) << "bcm2835_init failed (root?). All sensor reads will "
      "be faults and relays will not switch.";
    return;
  }
  ok = true;

  for (int i = 0; i < NUM_LIGHTS; i++) {
    // Set the level before switching to output, so that the relay
    // doesn't click on during startup.
    bcm2835_gpio_write(relay_pins[i], RelayLevel(false));
    bcm2835_gpio_fsel(relay_pins[i], BCM2835_GPIO_FSEL_OUTP);
    bcm2835_gpio_write(relay_pins[i], RelayLevel(false));

    bcm2835_gpio_fsel(ldr_pins[i], BCM2835_GPIO_FSEL_INPT);
    bcm2835_gpio_set_pud(ldr_pins[i], BCM2835_GPIO_PUD_DOWN);
  }

  LOG(INFO) << "GPIO ready. Relays on BCM "
            << relay_pins[0] << " " << relay_pins[1] << " "
            << relay_pins[2] << " " << relay_pins[3]
            << ", LDRs on BCM "
            << ldr_pins[0] << " " << ldr_pins[1] << " "
            << ldr_pins[2] << " " << ldr_pins[3];
}

HardwareSensorRelay::~HardwareSensorRelay() {
  if (!ok) return;
  AllOff();
  if (!bcm2835_close()) {
    LOG(ERROR) << "bcm2835_close failed";
  }
  ok = false;
  LOG(INFO) << "GPIO released.";
}

SensorRelay::Ambient HardwareSensorRelay::ReadAmbient(int idx) {
  Ambient a;
  if (!ok || idx < 0 || idx >= NUM_LIGHTS) {
    a.fault = true;
    return a;
  }
  a.dark = LevelIsDark(bcm2835_gpio_lev(ldr_pins[idx]));
  return a;
}

bool HardwareSensorRelay::SetRelay(int idx, bool on) {
  if (!ok || idx < 0 || idx >= NUM_LIGHTS) return false;
  bcm2835_gpio_write(relay_pins[idx], RelayLevel(on));
  return true;
}

int HardwareSensorRelay::SampleLux(bool dark) {
  return dark ? 0 : 100;
}
