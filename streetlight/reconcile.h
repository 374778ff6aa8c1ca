// Decides each light's state. Two paths write the light table:
//
//  - ReconcileAll, the automatic path, run on every poll. Dark turns
//    a light on and bright turns it off. The light at FAULT_INDEX is
//    never driven and always shows fault readings.
//  - SetManual, a direct command for one light from the web UI. It
//    takes effect immediately but is not remembered; the next
//    ReconcileAll applies automatic control again.
//
// Both hold the store's exclusive lock for their whole duration,
// including the adapter calls.

#ifndef _STREETLIGHT_RECONCILE_H
#define _STREETLIGHT_RECONCILE_H

#include <cstdint>
#include <string>

#include "arcfour.h"
#include "light-store.h"
#include "lights.h"
#include "sensor-relay.h"

struct Reconciler {
  // Doesn't take ownership. If auto_mode is false, ReconcileAll still
  // refreshes the sensor readings but leaves relays alone.
  Reconciler(LightStore *store, SensorRelay *sensors,
             const std::string &seed, bool auto_mode = true);

  // Run automatic control for every light in index order. Returns
  // the number of lights whose relay state changed.
  int ReconcileAll();

  // Manual command. light_id is 1..4 and action is "on" or "off"
  // (any case). On success, returns true and fills in *record (if
  // non-null) with the updated record. Otherwise returns false with
  // a message in *error (if non-null), and the table is unchanged.
  bool SetManual(int64_t light_id, const std::string &action,
                 LightRecord *record, std::string *error);

  bool AutoMode() const { return auto_mode; }

private:
  // Set the record to the ON or OFF state with freshly sampled
  // readings. Must hold the store's lock.
  void Apply(bool on, bool dark, LightRecord *r);
  // Put the record in fault mode (no relay change).
  static void ApplyFault(LightRecord *r);

  LightStore *store = nullptr;
  SensorRelay *sensors = nullptr;
  const bool auto_mode = true;
  // Only used with the store's exclusive lock held.
  ArcFour rc;
};

#endif
