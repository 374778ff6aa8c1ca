#include "sensor-relay.h"

#include <stdio.h>
#include <string>

#include "base/logging.h"
#include "lights.h"

using namespace std;

static void TestSimulated() {
  SimulatedSensorRelay sensors("test");
  CHECK_EQ(string("simulated"), sensors.Name());

  int dark = 0, bright = 0;
  for (int i = 0; i < 1000; i++) {
    SensorRelay::Ambient a = sensors.ReadAmbient(i % NUM_LIGHTS);
    CHECK(!a.fault);
    if (a.dark) dark++;
    else bright++;

    const int dlux = sensors.SampleLux(true);
    CHECK(dlux >= 0 && dlux <= 50) << dlux;
    const int blux = sensors.SampleLux(false);
    CHECK(blux >= 450 && blux <= 550) << blux;
  }
  // Coin flips.
  CHECK(dark > 400 && bright > 400) << dark << " " << bright;

  CHECK(sensors.ReadAmbient(-1).fault);
  CHECK(sensors.ReadAmbient(NUM_LIGHTS).fault);
}

static void TestSimulatedRelays() {
  SimulatedSensorRelay sensors("relays");
  for (int i = 0; i < NUM_LIGHTS; i++) CHECK(!sensors.RelayOn(i));
  CHECK(sensors.SetRelay(1, true));
  CHECK(sensors.SetRelay(3, true));
  CHECK(!sensors.RelayOn(0));
  CHECK(sensors.RelayOn(1));
  CHECK(sensors.RelayOn(3));
  CHECK(!sensors.SetRelay(NUM_LIGHTS, true));
  CHECK(!sensors.SetRelay(-1, false));

  sensors.AllOff();
  for (int i = 0; i < NUM_LIGHTS; i++) CHECK(!sensors.RelayOn(i));
}

static void TestFixed() {
  FixedSensorRelay sensors;
  CHECK(!sensors.ReadAmbient(0).dark);
  sensors.SetDark(0, true);
  sensors.SetFault(3, true);
  CHECK(sensors.ReadAmbient(0).dark);
  CHECK(!sensors.ReadAmbient(0).fault);
  CHECK(sensors.ReadAmbient(3).fault);
  CHECK(sensors.ReadAmbient(7).fault);
  CHECK_EQ(sensors.Reads(), 5);

  CHECK_EQ(sensors.SampleLux(true), 0);
  CHECK_EQ(sensors.SampleLux(false), 500);

  CHECK(sensors.SetRelay(2, true));
  CHECK(sensors.RelayOn(2));
  CHECK_EQ(sensors.RelayWrites(), 1);

  // Failed writes leave the relay alone and aren't counted.
  sensors.SetRelayFails(true);
  CHECK(!sensors.SetRelay(2, false));
  CHECK(sensors.RelayOn(2));
  CHECK_EQ(sensors.RelayWrites(), 1);
  // Logs, but doesn't die.
  sensors.AllOff();
  CHECK(sensors.RelayOn(2));

  sensors.SetRelayFails(false);
  sensors.AllOff();
  for (int i = 0; i < NUM_LIGHTS; i++) CHECK(!sensors.RelayOn(i));
  CHECK_EQ(sensors.RelayWrites(), 1 + NUM_LIGHTS);
}

int main(int argc, char **argv) {
  TestSimulated();
  TestSimulatedRelays();
  TestFixed();

  printf("OK\n");
  return 0;
}
