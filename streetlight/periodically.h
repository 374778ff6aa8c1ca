// Drives the background poll: says when the next reconcile pass is
// due. Times are in seconds since the epoch; the *At versions take
// the time explicitly so that tests can step a fake clock. Not
// thread-safe.

#ifndef _STREETLIGHT_PERIODICALLY_H
#define _STREETLIGHT_PERIODICALLY_H

#include <cstdint>
#include <time.h>

struct Periodically {
  // A period of zero or less means never run. Otherwise the first
  // run is due immediately.
  explicit Periodically(int seconds) :
    Periodically(seconds, time(nullptr)) {}
  Periodically(int seconds, int64_t now) :
    seconds(seconds), next_run(now), enabled(seconds > 0) {}

  bool Enabled() const { return enabled; }

  // Return true if a run is due. If so, we assume the caller does
  // the associated action now, and the next run is due 'seconds'
  // later. A caller that falls behind (e.g. the process was
  // suspended) gets one run, not a burst of them.
  bool ShouldRun() { return ShouldRunAt(time(nullptr)); }
  bool ShouldRunAt(int64_t now) {
    if (!enabled || now < next_run) return false;
    next_run = now + seconds;
    return true;
  }

  // Seconds until the next run is due; 0 if it's due now. Negative
  // if never.
  int64_t SecondsUntilAt(int64_t now) const {
    if (!enabled) return -1;
    return now >= next_run ? 0 : next_run - now;
  }

private:
  const int seconds = 0;
  int64_t next_run = 0;
  const bool enabled = false;
};

#endif
