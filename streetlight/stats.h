#ifndef _STREETLIGHT_STATS_H
#define _STREETLIGHT_STATS_H

#include <string>

#include "lights.h"

static constexpr double DEFAULT_CURRENT_WARNING_AMPS = 6.0;

static constexpr const char *STATUS_OK = "No Fault";
static constexpr const char *STATUS_HIGH_CURRENT = "Warning: High Current";

// System-wide totals over the lights that are on.
struct SystemStats {
  // BUS_VOLTAGE if any light is on, else 0. Not a sum.
  double total_voltage = 0.0;
  // Rounded to one decimal place.
  double total_current = 0.0;
  int total_lux = 0;
  std::string system_status = STATUS_OK;
  int lights_on = 0;
};

// Pure function of the table. The warning is raised when the
// (rounded) total current exceeds warning_amps.
SystemStats ComputeStats(const LightTable &table,
                         double warning_amps = DEFAULT_CURRENT_WARNING_AMPS);

// Multi-line, human-readable summary of the table and totals for the
// console, one line per light, e.g.
//   Light 1: ON  |   12 (DARK)   | 12.03 V 1.21 A
std::string StatusSummary(const LightTable &table, const SystemStats &stats);

#endif
