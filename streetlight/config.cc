#include "config.h"

#include <array>
#include <climits>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "base/logging.h"
#include "base/stringprintf.h"
#include "util.h"

using namespace std;

static optional<array<int, NUM_LIGHTS>> ParsePins(const string &s) {
  vector<string> toks = Util::Tokens(s);
  if (toks.size() != NUM_LIGHTS) return nullopt;
  array<int, NUM_LIGHTS> pins;
  for (int i = 0; i < NUM_LIGHTS; i++) {
    optional<int64_t> p = Util::ParseInt64Opt(toks[i]);
    // BCM GPIO numbers on the 40-pin header.
    if (!p.has_value() || *p < 0 || *p > 27) return nullopt;
    pins[i] = (int)*p;
  }
  return {pins};
}

static optional<bool> ParseBool(const string &s) {
  const string l = Util::lcase(s);
  if (l == "true" || l == "1" || l == "yes" || l == "on") return {true};
  if (l == "false" || l == "0" || l == "no" || l == "off") return {false};
  return nullopt;
}

optional<Config> Config::FromMap(const map<string, string> &m,
                                 string *error) {
  string error_unused;
  if (error == nullptr) error = &error_unused;

  Config config;
  for (const auto &p : m) {
    const string &key = p.first, &value = p.second;
    auto Bad = [&]() {
        *error = StringPrintf("Bad value for %s: [%s]",
                              key.c_str(), value.c_str());
        return nullopt;
      };

    if (key == "port") {
      optional<int64_t> port = Util::ParseInt64Opt(value);
      if (!port.has_value() || *port <= 0 || *port > 65535) return Bad();
      config.port = (int)*port;
    } else if (key == "mode") {
      const string l = Util::lcase(value);
      if (l == "simulated") config.mode = Mode::SIMULATED;
      else if (l == "hardware") config.mode = Mode::HARDWARE;
      else return Bad();
    } else if (key == "relay_pins") {
      auto pins = ParsePins(value);
      if (!pins.has_value()) return Bad();
      config.relay_pins = *pins;
    } else if (key == "ldr_pins") {
      auto pins = ParsePins(value);
      if (!pins.has_value()) return Bad();
      config.ldr_pins = *pins;
    } else if (key == "api_token") {
      config.api_token = value;
    } else if (key == "current_warning_amps") {
      optional<double> d = Util::ParseDoubleOpt(value);
      if (!d.has_value() || !std::isfinite(*d) || *d < 0.0) return Bad();
      config.current_warning_amps = *d;
    } else if (key == "auto_mode") {
      optional<bool> b = ParseBool(value);
      if (!b.has_value()) return Bad();
      config.auto_mode = *b;
    } else if (key == "poll_seconds") {
      optional<int64_t> s = Util::ParseInt64Opt(value);
      if (!s.has_value() || *s < 0 || *s > INT_MAX) return Bad();
      config.poll_seconds = (int)*s;
    } else if (key == "seed") {
      config.seed = value;
    } else {
      LOG(WARNING) << "Unknown config key " << key;
    }
  }

  // A pin can't be both a relay output and a sensor input.
  for (int r : config.relay_pins) {
    for (int l : config.ldr_pins) {
      if (r == l) {
        *error = StringPrintf("BCM pin %d is both a relay and an LDR", r);
        return nullopt;
      }
    }
  }

  return {config};
}

optional<Config> Config::FromFile(const string &filename, string *error) {
  optional<string> contents = Util::ReadFileOpt(filename);
  if (!contents.has_value()) {
    LOG(INFO) << "No config file " << filename << "; using defaults.";
    return FromMap({}, error);
  }
  return FromMap(Util::ParseMap(*contents), error);
}

const char *Config::ModeString(Mode m) {
  switch (m) {
  case Mode::SIMULATED: return "simulated";
  case Mode::HARDWARE: return "hardware";
  }
  return "?";
}
