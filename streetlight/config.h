// Settings, read from a text file with one "key value" per line,
// like
//
//   # Lights on BCM pins.
//   mode hardware
//   relay_pins 17 18 27 22
//   api_token s3cret
//
// Unknown keys are ignored (with a warning). Missing keys take the
// defaults below.

#ifndef _STREETLIGHT_CONFIG_H
#define _STREETLIGHT_CONFIG_H

#include <array>
#include <map>
#include <optional>
#include <string>

#include "lights.h"
#include "stats.h"

static constexpr const char *DEFAULT_CONFIG_FILE = "streetlight-config.txt";

struct Config {
  enum class Mode {
    SIMULATED,
    HARDWARE,
  };

  int port = 5000;
  Mode mode = Mode::SIMULATED;
  // BCM numbering.
  std::array<int, NUM_LIGHTS> relay_pins = {17, 18, 27, 22};
  std::array<int, NUM_LIGHTS> ldr_pins = {5, 6, 13, 19};
  // Shared secret for the API. Empty means every call is rejected.
  std::string api_token;
  double current_warning_amps = DEFAULT_CURRENT_WARNING_AMPS;
  bool auto_mode = true;
  // If positive, reconcile and print status this often even when
  // nobody is polling.
  int poll_seconds = 0;
  // Empty means seed from the clock.
  std::string seed;

  // Parse from key/value pairs. Returns nullopt and sets *error on a
  // malformed value.
  static std::optional<Config> FromMap(
      const std::map<std::string, std::string> &m, std::string *error);

  // Missing file is not an error; it just gives the defaults.
  static std::optional<Config> FromFile(const std::string &filename,
                                        std::string *error);

  static const char *ModeString(Mode m);
};

#endif
