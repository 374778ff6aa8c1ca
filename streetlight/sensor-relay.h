// Ambient-light sensing and relay output, one of each per light.
//
// Everything above this interface deals in logical ON/OFF and
// dark/bright. Electrical details (pin numbers, active-low relays)
// belong to the implementations.

#ifndef _STREETLIGHT_SENSOR_RELAY_H
#define _STREETLIGHT_SENSOR_RELAY_H

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "arcfour.h"
#include "lights.h"

struct SensorRelay {
  // Result of reading one ambient-light detector. A hardware failure
  // is reported as fault = true (and dark is meaningless) rather
  // than propagated.
  struct Ambient {
    bool dark = false;
    bool fault = false;
  };

  virtual ~SensorRelay();

  // Short name for logs, e.g. "hardware".
  virtual const char *Name() const = 0;

  virtual Ambient ReadAmbient(int idx) = 0;

  // Drive the relay for the light to the logical state. Returns false
  // if the hardware write failed; never throws.
  virtual bool SetRelay(int idx, bool on) = 0;

  // The illuminance proxy to report for a dark or bright reading.
  virtual int SampleLux(bool dark) = 0;

  // Drive every relay off, e.g. before shutdown.
  void AllOff();

protected:
  SensorRelay() {}
};

// Simulated sensors: every reading is a coin flip, and the relay
// just remembers its last logical state. Not thread-safe; callers
// hold the light store's lock.
struct SimulatedSensorRelay : public SensorRelay {
  explicit SimulatedSensorRelay(const std::string &seed);

  const char *Name() const override { return "simulated"; }
  Ambient ReadAmbient(int idx) override;
  bool SetRelay(int idx, bool on) override;
  // In [0, 50] when dark and [450, 550] when bright.
  int SampleLux(bool dark) override;

  // Last logical state written for the light.
  bool RelayOn(int idx) const { return relays[idx]; }

private:
  ArcFour rc;
  std::array<bool, NUM_LIGHTS> relays = {};
};

// Returns a fixed reading per light, for tests and bench setups.
// Records every relay write so that callers can see what was
// commanded. Relay writes can be made to fail.
struct FixedSensorRelay : public SensorRelay {
  FixedSensorRelay() {}

  const char *Name() const override { return "fixed"; }
  Ambient ReadAmbient(int idx) override;
  bool SetRelay(int idx, bool on) override;
  // 0 when dark, 500 when bright.
  int SampleLux(bool dark) override;

  void SetDark(int idx, bool dark);
  void SetFault(int idx, bool fault);
  void SetRelayFails(bool fails);

  bool RelayOn(int idx) const;
  // Total number of relay writes, and number of reads.
  int64_t RelayWrites() const;
  int64_t Reads() const;

private:
  // Tests poke at this from other threads.
  mutable std::mutex m;
  std::array<Ambient, NUM_LIGHTS> ambient = {};
  std::array<bool, NUM_LIGHTS> relays = {};
  bool relay_fails = false;
  int64_t relay_writes = 0;
  int64_t reads = 0;
};

#endif
