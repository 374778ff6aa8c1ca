#include "sensor-relay.h"

#include <cstdint>
#include <mutex>
#include <string>

#include "base/logging.h"
#include "randutil.h"
#include "threadutil.h"

using namespace std;

SensorRelay::~SensorRelay() {}

void SensorRelay::AllOff() {
  for (int i = 0; i < NUM_LIGHTS; i++) {
    if (!SetRelay(i, false)) {
      LOG(ERROR) << "Couldn't turn off relay for light " << (i + 1);
    }
  }
}

SimulatedSensorRelay::SimulatedSensorRelay(const string &seed) :
  rc(seed) {
  // Early ARCFOUR output is biased.
  rc.Discard(256);
}

SensorRelay::Ambient SimulatedSensorRelay::ReadAmbient(int idx) {
  Ambient a;
  if (idx < 0 || idx >= NUM_LIGHTS) {
    a.fault = true;
    return a;
  }
  a.dark = RandBool(&rc);
  return a;
}

bool SimulatedSensorRelay::SetRelay(int idx, bool on) {
  if (idx < 0 || idx >= NUM_LIGHTS) return false;
  relays[idx] = on;
  return true;
}

int SimulatedSensorRelay::SampleLux(bool dark) {
  return dark ? RandIntIn(&rc, 0, 50) : RandIntIn(&rc, 450, 550);
}

SensorRelay::Ambient FixedSensorRelay::ReadAmbient(int idx) {
  MutexLock ml(&m);
  reads++;
  if (idx < 0 || idx >= NUM_LIGHTS) {
    Ambient a;
    a.fault = true;
    return a;
  }
  return ambient[idx];
}

bool FixedSensorRelay::SetRelay(int idx, bool on) {
  MutexLock ml(&m);
  if (idx < 0 || idx >= NUM_LIGHTS || relay_fails) return false;
  relay_writes++;
  relays[idx] = on;
  return true;
}

int FixedSensorRelay::SampleLux(bool dark) {
  return dark ? 0 : 500;
}

void FixedSensorRelay::SetDark(int idx, bool dark) {
  CHECK(idx >= 0 && idx < NUM_LIGHTS) << idx;
  MutexLock ml(&m);
  ambient[idx].dark = dark;
}

void FixedSensorRelay::SetFault(int idx, bool fault) {
  CHECK(idx >= 0 && idx < NUM_LIGHTS) << idx;
  MutexLock ml(&m);
  ambient[idx].fault = fault;
}

void FixedSensorRelay::SetRelayFails(bool fails) {
  WriteWithLock(&m, &relay_fails, fails);
}

bool FixedSensorRelay::RelayOn(int idx) const {
  CHECK(idx >= 0 && idx < NUM_LIGHTS) << idx;
  MutexLock ml(&m);
  return relays[idx];
}

int64_t FixedSensorRelay::RelayWrites() const {
  return ReadWithLock(&m, &relay_writes);
}

int64_t FixedSensorRelay::Reads() const {
  return ReadWithLock(&m, &reads);
}
