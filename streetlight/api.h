// The dashboard's JSON API.
//
//   GET  /api/data   Reconcile every light, then report the table,
//                    totals and chart history.
//   POST /control    {"light_id": 1, "action": "on"}
//
// Both require the configured API token, either as
// "Authorization: Bearer <token>" or "X-Auth-Token: <token>".
// Unauthorized calls get 401 and never reach the lights.

#ifndef _STREETLIGHT_API_H
#define _STREETLIGHT_API_H

#include <ctime>
#include <functional>
#include <mutex>
#include <string>

#include "arcfour.h"
#include "config.h"
#include "http.h"
#include "light-store.h"
#include "reconcile.h"
#include "stats.h"

struct Api {
  using Clock = std::function<time_t()>;

  // Doesn't take ownership. mode is reported in the data payload,
  // e.g. "simulated".
  Api(const Config &config, LightStore *store, Reconciler *reconciler,
      const std::string &mode, Clock clock = nullptr);

  HttpResponse Data(const HttpRequest &request);
  HttpResponse Control(const HttpRequest &request);
  // Plain-text list of endpoints at "/", 404 elsewhere.
  HttpResponse Index(const HttpRequest &request);

  bool Authorized(const HttpRequest &request) const;

  // JSON for a light record, e.g. for tests and logs.
  static std::string LightJson(const LightRecord &r);
  // Quoted and escaped JSON string.
  static std::string JsonString(const std::string &s);

private:
  static HttpResponse Json(int code, const char *status,
                           const std::string &body);
  static HttpResponse Failure(int code, const char *status,
                              const std::string &message);

  const std::string api_token;
  const double warning_amps = DEFAULT_CURRENT_WARNING_AMPS;
  LightStore *store = nullptr;
  Reconciler *reconciler = nullptr;
  const std::string mode;
  Clock clock;

  std::mutex history_m;
  ArcFour history_rc;
};

#endif
