// The table of light records: the only mutable state shared between
// the web handlers and the background poll.
//
// Writers take the exclusive lock for the whole of an update (see
// Mutate), so readers never see a record whose relay state disagrees
// with its readings.

#ifndef _STREETLIGHT_LIGHT_STORE_H
#define _STREETLIGHT_LIGHT_STORE_H

#include <shared_mutex>

#include "lights.h"
#include "threadutil.h"

struct LightStore {
  // All lights start OFF with zero readings.
  LightStore();

  // Copy of the table, taken under the shared lock.
  LightTable Snapshot() const;

  // Copy of one record. idx must be in [0, NUM_LIGHTS).
  LightRecord Get(int idx) const;

  // Run f(LightTable *) with the exclusive lock held. f must not
  // call back into the store.
  template<class F>
  void Mutate(F f) {
    WriteMutexLock ml(&m);
    f(&table);
  }

private:
  mutable std::shared_mutex m;
  LightTable table;
};

#endif
