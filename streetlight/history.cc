#include "history.h"

#include <ctime>
#include <string>

#include "base/stringprintf.h"
#include "lights.h"
#include "randutil.h"

using namespace std;

History SynthesizeHistory(ArcFour *rc, time_t now) {
  History h;
  struct tm lt;
  localtime_r(&now, &lt);

  for (int i = HISTORY_POINTS - 1; i >= 0; i--) {
    const int hour = ((lt.tm_hour - i) % 24 + 24) % 24;
    h.labels.push_back(StringPrintf("%02d:00", hour));
    const double v = RandDoubleIn(rc, VOLTAGE_MIN, VOLTAGE_MAX);
    const double c = RandDoubleIn(rc, CURRENT_MIN, CURRENT_MAX);
    h.voltage.push_back(v);
    h.current.push_back(c);
  }
  return h;
}
