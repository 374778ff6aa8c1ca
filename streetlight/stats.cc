#include "stats.h"

#include <cmath>
#include <string>

#include "base/stringprintf.h"

SystemStats ComputeStats(const LightTable &table, double warning_amps) {
  SystemStats stats;
  double current = 0.0;
  for (const LightRecord &r : table) {
    if (!r.IsOn()) continue;
    stats.lights_on++;
    current += r.current;
    stats.total_lux += r.lux;
  }

  stats.total_voltage = stats.lights_on > 0 ? BUS_VOLTAGE : 0.0;
  stats.total_current = std::round(current * 10.0) / 10.0;
  stats.system_status = stats.total_current > warning_amps ?
    STATUS_HIGH_CURRENT : STATUS_OK;
  return stats;
}

std::string StatusSummary(const LightTable &table, const SystemStats &stats) {
  std::string out;
  for (const LightRecord &r : table) {
    std::string lux;
    if (r.lux == LUX_FAULT) {
      lux = "FAILED";
    } else if (r.lux < 100) {
      lux = StringPrintf("%4d (DARK)", r.lux);
    } else {
      lux = StringPrintf("%4d (BRIGHT)", r.lux);
    }
    StringAppendF(&out, "Light %d: %-3s | %-13s | %5.2f V %4.2f A\n",
                  r.id, RelayStateString(r.relay_state), lux.c_str(),
                  r.voltage, r.current);
  }
  StringAppendF(&out, "Total: %.1f V %.1f A %d lux, %d on. %s\n",
                stats.total_voltage, stats.total_current, stats.total_lux,
                stats.lights_on, stats.system_status.c_str());
  return out;
}
