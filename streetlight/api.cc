#include "api.h"

#include <cmath>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

#include "base/logging.h"
#include "base/stringprintf.h"
#include "history.h"
#include "threadutil.h"
#include "util.h"

using namespace std;

// A configured seed makes the charts reproducible.
static string HistorySeed(const Config &config) {
  if (!config.seed.empty()) return "history " + config.seed;
  return StringPrintf("history %lld", (long long)time(nullptr));
}

Api::Api(const Config &config, LightStore *store, Reconciler *reconciler,
         const string &mode, Clock clock_in) :
  api_token(config.api_token),
  warning_amps(config.current_warning_amps),
  store(store), reconciler(reconciler), mode(mode),
  clock(std::move(clock_in)),
  history_rc(HistorySeed(config)) {
  CHECK(store != nullptr);
  CHECK(reconciler != nullptr);
  if (!clock) clock = []() { return time(nullptr); };
}

string Api::JsonString(const string &s) {
  string out = "\"";
  for (char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if ((unsigned char)c < 0x20) {
        StringAppendF(&out, "\\u%04x", (unsigned int)(unsigned char)c);
      } else {
        out += c;
      }
    }
  }
  out += "\"";
  return out;
}

string Api::LightJson(const LightRecord &r) {
  return StringPrintf("{\"id\": %d, \"relay_state\": \"%s\", "
                      "\"voltage\": %.2f, \"current\": %.2f, "
                      "\"lux\": %d}",
                      r.id, RelayStateString(r.relay_state),
                      r.voltage, r.current, r.lux);
}

HttpResponse Api::Json(int code, const char *status, const string &body) {
  HttpResponse r;
  r.code = code;
  r.status = status;
  r.content_type = "application/json";
  r.body = body;
  return r;
}

HttpResponse Api::Failure(int code, const char *status,
                          const string &message) {
  return Json(code, status,
              StringPrintf("{\"success\": false, \"message\": %s}\n",
                           JsonString(message).c_str()));
}

bool Api::Authorized(const HttpRequest &request) const {
  if (api_token.empty()) return false;

  if (const string *auth = request.GetHeader("Authorization")) {
    string rest = Util::NormalizeWhitespace(*auth);
    string scheme = Util::chop(rest);
    if (Util::lcase(scheme) == "bearer" &&
        Util::losewhitel(rest) == api_token)
      return true;
  }

  if (const string *tok = request.GetHeader("X-Auth-Token")) {
    if (Util::NormalizeWhitespace(*tok) == api_token)
      return true;
  }

  return false;
}

static string JoinDoubles(const vector<double> &v, const char *fmt) {
  string out = "[";
  for (int i = 0; i < (int)v.size(); i++) {
    if (i > 0) out += ", ";
    StringAppendF(&out, fmt, v[i]);
  }
  out += "]";
  return out;
}

static string JoinStrings(const vector<string> &v) {
  string out = "[";
  for (int i = 0; i < (int)v.size(); i++) {
    if (i > 0) out += ", ";
    out += Api::JsonString(v[i]);
  }
  out += "]";
  return out;
}

HttpResponse Api::Data(const HttpRequest &request) {
  if (!Authorized(request))
    return Failure(401, "Unauthorized", "Unauthorized");
  if (request.method != "GET")
    return Failure(405, "Method Not Allowed", "Use GET");

  reconciler->ReconcileAll();
  const LightTable table = store->Snapshot();
  const SystemStats stats = ComputeStats(table, warning_amps);

  const time_t now = clock();
  History history;
  {
    MutexLock ml(&history_m);
    history = SynthesizeHistory(&history_rc, now);
  }

  struct tm lt;
  localtime_r(&now, &lt);
  char timebuf[64];
  strftime(timebuf, sizeof (timebuf), "%Y-%m-%d %H:%M:%S", &lt);

  string body = "{\"success\": true,\n \"lights\": [\n";
  for (int i = 0; i < NUM_LIGHTS; i++) {
    StringAppendF(&body, "  %s%s\n", LightJson(table[i]).c_str(),
                  i < NUM_LIGHTS - 1 ? "," : "");
  }
  body += " ],\n";

  StringAppendF(&body,
                " \"stats\": {\"total_voltage\": %.1f, "
                "\"total_current\": %.1f, \"total_lux\": %d, "
                "\"system_status\": %s},\n",
                stats.total_voltage, stats.total_current, stats.total_lux,
                JsonString(stats.system_status).c_str());

  const string labels = JoinStrings(history.labels);
  StringAppendF(&body,
                " \"charts\": {\n"
                "  \"voltage\": {\"labels\": %s, \"data\": %s},\n"
                "  \"current\": {\"labels\": %s, \"data\": %s}\n"
                " },\n",
                labels.c_str(),
                JoinDoubles(history.voltage, "%.2f").c_str(),
                labels.c_str(),
                JoinDoubles(history.current, "%.2f").c_str());

  StringAppendF(&body, " \"time\": %s,\n \"mode\": %s}\n",
                JsonString(timebuf).c_str(),
                JsonString(mode).c_str());

  return Json(200, "OK", body);
}

// Accepts a JSON integer, an integral double, or a string holding an
// integer, like the dashboard sometimes sends.
static optional<int64_t> GetLightId(const rapidjson::Value &v) {
  if (v.IsInt64()) return {v.GetInt64()};
  if (v.IsDouble()) {
    const double d = v.GetDouble();
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1.0e15)
      return {(int64_t)d};
    return nullopt;
  }
  if (v.IsString()) return Util::ParseInt64Opt(v.GetString());
  return nullopt;
}

HttpResponse Api::Control(const HttpRequest &request) {
  if (!Authorized(request))
    return Failure(401, "Unauthorized", "Unauthorized");
  if (request.method != "POST")
    return Failure(405, "Method Not Allowed", "Use POST");

  rapidjson::Document doc;
  doc.Parse(request.body.c_str());
  if (doc.HasParseError() || !doc.IsObject())
    return Failure(400, "Bad Request", "Invalid JSON payload");

  // Missing light_id counts as 0, which is then rejected as out of
  // range.
  int64_t light_id = 0;
  if (doc.HasMember("light_id")) {
    optional<int64_t> id = GetLightId(doc["light_id"]);
    if (!id.has_value())
      return Failure(400, "Bad Request", "Invalid light id. Must be 1-4.");
    light_id = *id;
  }

  string action;
  if (doc.HasMember("action")) {
    if (!doc["action"].IsString())
      return Failure(400, "Bad Request",
                     "Invalid action. Must be \"on\" or \"off\".");
    action = doc["action"].GetString();
  }

  LightRecord record;
  string error;
  if (!reconciler->SetManual(light_id, action, &record, &error))
    return Failure(400, "Bad Request", error);

  const string act = Util::lcase(action);
  const char *state = RelayStateString(record.relay_state);
  return Json(200, "OK",
              StringPrintf("{\"success\": true, "
                           "\"message\": \"Light %d turned %s\", "
                           "\"light_id\": %d, \"action\": %s, "
                           "\"status\": \"%s\", \"light\": %s}\n",
                           record.id, state, record.id,
                           JsonString(act).c_str(), state,
                           LightJson(record).c_str()));
}

HttpResponse Api::Index(const HttpRequest &request) {
  HttpResponse r;
  if (request.PathOnly() != "/") {
    r.code = 404;
    r.status = "Not Found";
    r.body = "Not found\n";
    return r;
  }
  r.body =
    "Street light controller\n"
    "\n"
    "GET  /api/data  lights, totals and chart history\n"
    "POST /control   {\"light_id\": 1..4, \"action\": \"on\"|\"off\"}\n";
  return r;
}
