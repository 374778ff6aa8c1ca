#include "light-store.h"

#include <shared_mutex>

#include "base/logging.h"

LightStore::LightStore() {
  for (int i = 0; i < NUM_LIGHTS; i++) {
    table[i].id = i + 1;
    table[i].relay_state = RelayState::OFF;
    table[i].voltage = 0.0;
    table[i].current = 0.0;
    table[i].lux = 0;
  }
}

LightTable LightStore::Snapshot() const {
  return ReadWithLock(&m, &table);
}

LightRecord LightStore::Get(int idx) const {
  CHECK(idx >= 0 && idx < NUM_LIGHTS) << idx;
  ReadMutexLock ml(&m);
  return table[idx];
}
