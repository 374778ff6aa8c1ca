// The per-light state record and the constants that describe the
// fleet.

#ifndef _STREETLIGHT_LIGHTS_H
#define _STREETLIGHT_LIGHTS_H

#include <array>

// Fixed fleet. Lights are indexed 0..3 internally and displayed as
// ids 1..4.
static constexpr int NUM_LIGHTS = 4;

// The third light's sensor is dead. Automatic control never drives it
// and always reports it in fault mode.
static constexpr int FAULT_INDEX = 2;

// lux value meaning "sensor fault / unmeasured".
static constexpr int LUX_FAULT = -1;

// Sampling ranges while a light is on.
static constexpr double VOLTAGE_MIN = 11.5;
static constexpr double VOLTAGE_MAX = 12.5;
static constexpr double CURRENT_MIN = 1.0;
static constexpr double CURRENT_MAX = 1.4;

// The bus voltage whenever any load is present.
static constexpr double BUS_VOLTAGE = 12.0;

enum class RelayState {
  OFF = 0,
  ON = 1,
};

inline const char *RelayStateString(RelayState s) {
  return s == RelayState::ON ? "ON" : "OFF";
}

struct LightRecord {
  // 1..4.
  int id = 0;
  RelayState relay_state = RelayState::OFF;
  double voltage = 0.0;
  double current = 0.0;
  int lux = 0;

  bool IsOn() const { return relay_state == RelayState::ON; }
};

using LightTable = std::array<LightRecord, NUM_LIGHTS>;

// True if the ON/OFF state agrees with the electrical readings:
// ON means positive voltage and current, OFF means both zero.
inline bool Coupled(const LightRecord &r) {
  if (r.IsOn()) return r.voltage > 0.0 && r.current > 0.0;
  return r.voltage == 0.0 && r.current == 0.0;
}

#endif
