// Chart data for the dashboard. There's no stored history; each
// request gets a fresh, plausible-looking series.

#ifndef _STREETLIGHT_HISTORY_H
#define _STREETLIGHT_HISTORY_H

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "arcfour.h"

static constexpr int HISTORY_POINTS = 6;

struct History {
  // "HH:00", oldest first. The last label is the hour containing now.
  std::vector<std::string> labels;
  std::vector<double> voltage;
  std::vector<double> current;
};

// Voltage samples are in [VOLTAGE_MIN, VOLTAGE_MAX] and current
// in [CURRENT_MIN, CURRENT_MAX]. Labels use local time.
History SynthesizeHistory(ArcFour *rc, time_t now);

#endif
