#include "api.h"

#include <ctime>
#include <memory>
#include <stdio.h>
#include <string>
#include <unistd.h>

#include <rapidjson/document.h>

#include "base/logging.h"
#include "config.h"
#include "http.h"
#include "light-store.h"
#include "lights.h"
#include "reconcile.h"
#include "sensor-relay.h"

using namespace std;

static constexpr char TOKEN[] = "s3cret";

// Everything a test needs, with all lights seeing darkness except
// the second.
struct Fixture {
  explicit Fixture(const string &seed = "") :
    reconciler(&store, &sensors, "api test") {
    config.api_token = TOKEN;
    config.seed = seed;
    for (int i = 0; i < NUM_LIGHTS; i++) sensors.SetDark(i, i != 1);
    api.reset(new Api(config, &store, &reconciler, "fixed",
                      []() { return (time_t)1700000000; }));
  }

  Config config;
  LightStore store;
  FixedSensorRelay sensors;
  Reconciler reconciler;
  std::unique_ptr<Api> api;
};

static HttpRequest Request(const string &method, const string &path,
                           const string &body = "") {
  HttpRequest req;
  req.method = method;
  req.path = path;
  req.headers.emplace_back("Authorization", string("Bearer ") + TOKEN);
  req.headers.emplace_back("Content-Type", "application/json");
  req.body = body;
  return req;
}

static void ParseJson(const HttpResponse &resp, rapidjson::Document *doc) {
  CHECK_EQ(resp.content_type, "application/json");
  doc->Parse(resp.body.c_str());
  CHECK(!doc->HasParseError()) << resp.body;
  CHECK(doc->IsObject()) << resp.body;
}

static void TestAuth() {
  Fixture f;

  HttpRequest req;
  req.method = "GET";
  req.path = "/api/data";
  CHECK(!f.api->Authorized(req));
  HttpResponse resp = f.api->Data(req);
  CHECK_EQ(resp.code, 401);
  rapidjson::Document doc;
  ParseJson(resp, &doc);
  CHECK(!doc["success"].GetBool());
  // Never reached the lights.
  CHECK_EQ(f.sensors.Reads(), 0);

  req.headers = {{"Authorization", "Bearer wrong"}};
  CHECK_EQ(f.api->Data(req).code, 401);
  req.headers = {{"Authorization", "s3cret"}};
  CHECK_EQ(f.api->Data(req).code, 401);
  req.headers = {{"X-Auth-Token", "s3cre"}};
  CHECK_EQ(f.api->Data(req).code, 401);

  req.method = "POST";
  req.path = "/control";
  req.body = "{\"light_id\": 1, \"action\": \"on\"}";
  CHECK_EQ(f.api->Control(req).code, 401);
  CHECK_EQ(f.sensors.RelayWrites(), 0);
  CHECK(!f.store.Get(0).IsOn());

  req.headers = {{"authorization", "bearer s3cret"}};
  CHECK(f.api->Authorized(req));
  req.headers = {{"x-auth-token", "s3cret"}};
  CHECK(f.api->Authorized(req));
  CHECK_EQ(f.api->Control(req).code, 200);
}

static void TestEmptyToken() {
  Config config;
  LightStore store;
  FixedSensorRelay sensors;
  Reconciler reconciler(&store, &sensors, "empty token");
  Api api(config, &store, &reconciler, "fixed");

  HttpRequest req;
  req.method = "GET";
  req.path = "/api/data";
  CHECK_EQ(api.Data(req).code, 401);
  req.headers = {{"Authorization", "Bearer "}};
  CHECK_EQ(api.Data(req).code, 401);
  req.headers = {{"X-Auth-Token", ""}};
  CHECK_EQ(api.Data(req).code, 401);
}

static void TestData() {
  Fixture f;
  HttpResponse resp = f.api->Data(Request("GET", "/api/data"));
  CHECK_EQ(resp.code, 200);
  rapidjson::Document doc;
  ParseJson(resp, &doc);

  CHECK(doc["success"].GetBool());
  CHECK_EQ(string("fixed"), doc["mode"].GetString());
  CHECK(doc["time"].IsString());

  const rapidjson::Value &lights = doc["lights"];
  CHECK(lights.IsArray());
  CHECK_EQ((int)lights.Size(), NUM_LIGHTS);
  for (int i = 0; i < NUM_LIGHTS; i++) {
    const rapidjson::Value &l = lights[i];
    CHECK_EQ(l["id"].GetInt(), i + 1);
    const string state = l["relay_state"].GetString();
    const double v = l["voltage"].GetDouble();
    const double c = l["current"].GetDouble();
    if (state == "ON") {
      CHECK(v >= VOLTAGE_MIN && v <= VOLTAGE_MAX) << v;
      CHECK(c >= CURRENT_MIN && c <= CURRENT_MAX) << c;
    } else {
      CHECK_EQ(state, "OFF");
      CHECK_EQ(v, 0.0);
      CHECK_EQ(c, 0.0);
    }
  }
  CHECK_EQ(string("ON"), lights[0]["relay_state"].GetString());
  CHECK_EQ(string("OFF"), lights[1]["relay_state"].GetString());
  CHECK_EQ(lights[1]["lux"].GetInt(), 500);
  CHECK_EQ(string("OFF"), lights[2]["relay_state"].GetString());
  CHECK_EQ(lights[2]["lux"].GetInt(), LUX_FAULT);
  CHECK_EQ(string("ON"), lights[3]["relay_state"].GetString());

  const rapidjson::Value &stats = doc["stats"];
  CHECK_EQ(stats["total_voltage"].GetDouble(), 12.0);
  const double total_current = stats["total_current"].GetDouble();
  CHECK(total_current >= 2.0 && total_current <= 2.8) << total_current;
  // Two lights at lux 0, one at 500; the fault light isn't on.
  CHECK_EQ(stats["total_lux"].GetInt(), 0);
  CHECK_EQ(string("No Fault"), stats["system_status"].GetString());

  for (const char *chart : {"voltage", "current"}) {
    const rapidjson::Value &ch = doc["charts"][chart];
    CHECK_EQ((int)ch["labels"].Size(), 6);
    CHECK_EQ((int)ch["data"].Size(), 6);
  }
  const time_t now = 1700000000;
  struct tm lt;
  localtime_r(&now, &lt);
  char label[16];
  snprintf(label, sizeof (label), "%02d:00", lt.tm_hour);
  CHECK_EQ(string(label), doc["charts"]["voltage"]["labels"][5].GetString());

  resp = f.api->Data(Request("POST", "/api/data"));
  CHECK_EQ(resp.code, 405);
}

static void CheckBadControl(Fixture *f, const string &body,
                            const char *message_part) {
  const LightTable before = f->store.Snapshot();
  HttpResponse resp = f->api->Control(Request("POST", "/control", body));
  CHECK_EQ(resp.code, 400) << body;
  rapidjson::Document doc;
  ParseJson(resp, &doc);
  CHECK(!doc["success"].GetBool());
  const string message = doc["message"].GetString();
  CHECK(message.find(message_part) != string::npos) << message;

  const LightTable after = f->store.Snapshot();
  for (int i = 0; i < NUM_LIGHTS; i++) {
    CHECK(before[i].relay_state == after[i].relay_state);
    CHECK_EQ(before[i].voltage, after[i].voltage);
    CHECK_EQ(before[i].current, after[i].current);
    CHECK_EQ(before[i].lux, after[i].lux);
  }
}

static void TestControlErrors() {
  Fixture f;
  f.api->Data(Request("GET", "/api/data"));
  const int64_t writes = f.sensors.RelayWrites();

  CheckBadControl(&f, "", "Invalid JSON");
  CheckBadControl(&f, "{light_id: 1}", "Invalid JSON");
  CheckBadControl(&f, "[1, \"on\"]", "Invalid JSON");
  CheckBadControl(&f, "{\"light_id\": 5, \"action\": \"on\"}",
                  "Invalid light id: 5");
  CheckBadControl(&f, "{\"light_id\": 0, \"action\": \"on\"}",
                  "Must be 1-4");
  CheckBadControl(&f, "{\"action\": \"on\"}", "Invalid light id");
  CheckBadControl(&f, "{\"light_id\": 1.5, \"action\": \"on\"}",
                  "Invalid light id");
  CheckBadControl(&f, "{\"light_id\": \"one\", \"action\": \"on\"}",
                  "Invalid light id");
  CheckBadControl(&f, "{\"light_id\": 1, \"action\": \"xyz\"}",
                  "Invalid action: xyz");
  CheckBadControl(&f, "{\"light_id\": 1}", "Invalid action");
  CheckBadControl(&f, "{\"light_id\": 1, \"action\": true}",
                  "Invalid action");

  CHECK_EQ(f.sensors.RelayWrites(), writes);

  HttpResponse resp = f.api->Control(Request("GET", "/control"));
  CHECK_EQ(resp.code, 405);
}

static void TestControl() {
  Fixture f;
  HttpResponse resp = f.api->Control(
      Request("POST", "/control", "{\"light_id\": 2, \"action\": \"on\"}"));
  CHECK_EQ(resp.code, 200);
  rapidjson::Document doc;
  ParseJson(resp, &doc);
  CHECK(doc["success"].GetBool());
  CHECK_EQ(string("Light 2 turned ON"), doc["message"].GetString());
  CHECK_EQ(doc["light_id"].GetInt(), 2);
  CHECK_EQ(string("on"), doc["action"].GetString());
  CHECK_EQ(string("ON"), doc["status"].GetString());
  const rapidjson::Value &light = doc["light"];
  CHECK_EQ(light["id"].GetInt(), 2);
  CHECK_EQ(string("ON"), light["relay_state"].GetString());
  CHECK(light["voltage"].GetDouble() >= VOLTAGE_MIN);

  CHECK(f.store.Get(1).IsOn());
  CHECK(f.sensors.RelayOn(1));

  // Numeric strings and upper case are accepted.
  resp = f.api->Control(
      Request("POST", "/control",
              "{\"light_id\": \"2\", \"action\": \"OFF\"}"));
  CHECK_EQ(resp.code, 200) << resp.body;
  ParseJson(resp, &doc);
  CHECK_EQ(string("Light 2 turned OFF"), doc["message"].GetString());
  CHECK_EQ(string("off"), doc["action"].GetString());
  CHECK_EQ(doc["light"]["voltage"].GetDouble(), 0.0);
  CHECK(!f.store.Get(1).IsOn());
  CHECK(!f.sensors.RelayOn(1));

  // X-Auth-Token works too.
  HttpRequest req;
  req.method = "POST";
  req.path = "/control";
  req.headers = {{"X-Auth-Token", TOKEN}};
  req.body = "{\"light_id\": 4.0, \"action\": \"on\"}";
  CHECK_EQ(f.api->Control(req).code, 200);
  CHECK(f.store.Get(3).IsOn());
}

// A failed relay write shows up as an unmeasured, unlit light.
static void TestControlRelayFails() {
  Fixture f;
  f.sensors.SetRelayFails(true);
  HttpResponse resp = f.api->Control(
      Request("POST", "/control",
              "{\"light_id\": 2, \"action\": \"on\"}"));
  CHECK_EQ(resp.code, 200) << resp.body;
  rapidjson::Document doc;
  ParseJson(resp, &doc);
  CHECK_EQ(string("on"), doc["action"].GetString());
  CHECK_EQ(string("OFF"), doc["status"].GetString());
  const rapidjson::Value &light = doc["light"];
  CHECK_EQ(string("OFF"), light["relay_state"].GetString());
  CHECK_EQ(light["voltage"].GetDouble(), 0.0);
  CHECK_EQ(light["current"].GetDouble(), 0.0);
  CHECK_EQ(light["lux"].GetInt(), LUX_FAULT);
  CHECK(!f.store.Get(1).IsOn());
}

// With a configured seed, the whole payload (chart history included)
// is reproducible, even for servers started at different times.
static void TestSeededData() {
  Fixture a("fixed seed");
  const string body_a = a.api->Data(Request("GET", "/api/data")).body;
  // Make sure the wall clock moves on.
  sleep(1);
  usleep(100000);
  Fixture b("fixed seed");
  const string body_b = b.api->Data(Request("GET", "/api/data")).body;
  CHECK_EQ(body_a, body_b);

  Fixture c("other seed");
  const string body_c = c.api->Data(Request("GET", "/api/data")).body;
  CHECK(body_a != body_c);
}

static void TestIndex() {
  Fixture f;
  HttpRequest req;
  req.method = "GET";
  req.path = "/";
  HttpResponse resp = f.api->Index(req);
  CHECK_EQ(resp.code, 200);
  CHECK(resp.body.find("/api/data") != string::npos);

  req.path = "/?x=1";
  CHECK_EQ(f.api->Index(req).code, 200);
  req.path = "/favicon.ico";
  CHECK_EQ(f.api->Index(req).code, 404);
}

static void TestJsonString() {
  CHECK_EQ(Api::JsonString("plain"), "\"plain\"");
  CHECK_EQ(Api::JsonString("say \"hi\"\n"), "\"say \\\"hi\\\"\\n\"");
  CHECK_EQ(Api::JsonString(string("\x01", 1)), "\"\\u0001\"");
}

int main(int argc, char **argv) {
  TestAuth();
  TestEmptyToken();
  TestData();
  TestControlErrors();
  TestControl();
  TestControlRelayFails();
  TestSeededData();
  TestIndex();
  TestJsonString();

  printf("OK\n");
  return 0;
}
