#include "reconcile.h"

#include <cstdint>
#include <string>

#include "base/logging.h"
#include "base/stringprintf.h"
#include "randutil.h"
#include "util.h"

using namespace std;

Reconciler::Reconciler(LightStore *store, SensorRelay *sensors,
                       const string &seed, bool auto_mode) :
  store(store), sensors(sensors), auto_mode(auto_mode), rc(seed) {
  CHECK(store != nullptr);
  CHECK(sensors != nullptr);
  rc.Discard(256);
}

void Reconciler::ApplyFault(LightRecord *r) {
  r->lux = LUX_FAULT;
  r->voltage = 0.0;
  r->current = 0.0;
}

void Reconciler::Apply(bool on, bool dark, LightRecord *r) {
  if (on) {
    r->relay_state = RelayState::ON;
    r->voltage = RandDoubleIn(&rc, VOLTAGE_MIN, VOLTAGE_MAX);
    r->current = RandDoubleIn(&rc, CURRENT_MIN, CURRENT_MAX);
  } else {
    r->relay_state = RelayState::OFF;
    r->voltage = 0.0;
    r->current = 0.0;
  }
  r->lux = sensors->SampleLux(dark);
}

int Reconciler::ReconcileAll() {
  int changed = 0;
  store->Mutate([this, &changed](LightTable *table) {
      for (int idx = 0; idx < NUM_LIGHTS; idx++) {
        LightRecord *r = &(*table)[idx];

        if (idx == FAULT_INDEX) {
          // Relay state is left as-is; a manual command may have
          // turned it on.
          ApplyFault(r);
          continue;
        }

        const RelayState before = r->relay_state;
        const SensorRelay::Ambient ambient = sensors->ReadAmbient(idx);

        if (ambient.fault) {
          // Can't see anything; fail safe.
          if (!sensors->SetRelay(idx, false)) {
            LOG(ERROR) << "Relay write failed for light " << r->id;
          }
          r->relay_state = RelayState::OFF;
          ApplyFault(r);
        } else if (!auto_mode) {
          Apply(r->IsOn(), ambient.dark, r);
        } else {
          const bool on = ambient.dark;
          if (sensors->SetRelay(idx, on)) {
            Apply(on, ambient.dark, r);
          } else {
            LOG(ERROR) << "Relay write failed for light " << r->id;
            r->relay_state = RelayState::OFF;
            ApplyFault(r);
          }
        }

        if (r->relay_state != before) {
          changed++;
          LOG(INFO) << "Auto: Light " << r->id << " turned "
                    << RelayStateString(r->relay_state)
                    << (ambient.fault ? " (sensor fault)" :
                        ambient.dark ? " (dark detected)" :
                        " (bright detected)");
        }
      }
    });
  return changed;
}

bool Reconciler::SetManual(int64_t light_id, const string &action,
                           LightRecord *record, string *error) {
  string error_unused;
  if (error == nullptr) error = &error_unused;

  if (light_id < 1 || light_id > NUM_LIGHTS) {
    *error = StringPrintf("Invalid light id: %lld. Must be 1-%d.",
                          (long long)light_id, NUM_LIGHTS);
    return false;
  }

  const string act = Util::lcase(action);
  if (act != "on" && act != "off") {
    *error = StringPrintf("Invalid action: %s. Must be \"on\" or \"off\".",
                          action.c_str());
    return false;
  }

  const bool on = act == "on";
  const int idx = (int)light_id - 1;
  store->Mutate([&](LightTable *table) {
      LightRecord *r = &(*table)[idx];
      if (sensors->SetRelay(idx, on)) {
        // No ambient reading here; a lit street light implies it's dark.
        Apply(on, on, r);
      } else {
        // We don't know what the relay is doing, so report it as
        // off and unmeasured.
        LOG(ERROR) << "Relay write failed for light " << r->id;
        r->relay_state = RelayState::OFF;
        ApplyFault(r);
      }
      if (record != nullptr) *record = *r;
    });

  LOG(INFO) << "Manual: Light " << light_id << " set "
            << (on ? "ON" : "OFF");
  return true;
}
