// Street light controller: serves the dashboard API and, optionally,
// polls the sensors on its own.
//
// Usage: streetlight [config-file]

#include <ctime>
#include <memory>
#include <optional>
#include <signal.h>
#include <stdio.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>

#include "api.h"
#include "base/logging.h"
#include "base/stringprintf.h"
#include "config.h"
#include "hardware-sensor-relay.h"
#include "http-server.h"
#include "light-store.h"
#include "periodically.h"
#include "reconcile.h"
#include "sensor-relay.h"
#include "stats.h"

using namespace std;

static volatile sig_atomic_t should_die = 0;

static void HandleSignal(int) {
  should_die = 1;
}

struct Server {
  Server(const Config &config, Api *api) : api(api) {
    server.reset(HttpServer::Create());
    CHECK(server.get() != nullptr);

    server->AddHandler("/api/data",
                       [this](const HttpRequest &req) {
                         return this->api->Data(req);
                       });
    server->AddHandler("/control",
                       [this](const HttpRequest &req) {
                         return this->api->Control(req);
                       });
    server->AddHandler("/",
                       [this](const HttpRequest &req) {
                         return this->api->Index(req);
                       });

    const int port = config.port;
    listen_thread = std::thread([this, port]() {
        if (!this->server->ListenOn(port)) {
          LOG(ERROR) << "Server failed; shutting down.";
          should_die = 1;
        }
      });
  }

  ~Server() {
    server->Stop();
    listen_thread.join();
  }

  Api *api = nullptr;
  std::unique_ptr<HttpServer> server;
  std::thread listen_thread;
};

static std::unique_ptr<SensorRelay> MakeSensors(const Config &config,
                                                const string &seed) {
  switch (config.mode) {
  case Config::Mode::HARDWARE:
    return std::make_unique<HardwareSensorRelay>(config.relay_pins,
                                                 config.ldr_pins);
  case Config::Mode::SIMULATED:
    return std::make_unique<SimulatedSensorRelay>("sensors " + seed);
  }
  LOG(FATAL) << "Unknown mode";
  return nullptr;
}

int main(int argc, char **argv) {
  const string config_file = argc > 1 ? argv[1] : DEFAULT_CONFIG_FILE;
  string error;
  std::optional<Config> config_opt = Config::FromFile(config_file, &error);
  CHECK(config_opt.has_value()) << config_file << ": " << error;
  const Config config = std::move(*config_opt);

  const string seed = config.seed.empty() ?
    StringPrintf("%lld.%d", (long long)time(nullptr), (int)getpid()) :
    config.seed;

  struct sigaction sa = {};
  sa.sa_handler = HandleSignal;
  sigemptyset(&sa.sa_mask);
  CHECK(sigaction(SIGINT, &sa, nullptr) == 0);
  CHECK(sigaction(SIGTERM, &sa, nullptr) == 0);

  if (config.api_token.empty()) {
    LOG(WARNING) << "No api_token configured. Every API call will be "
      "rejected as unauthorized.";
  }

  std::unique_ptr<SensorRelay> sensors = MakeSensors(config, seed);
  LightStore store;
  Reconciler reconciler(&store, sensors.get(), "reconcile " + seed,
                        config.auto_mode);
  Api api(config, &store, &reconciler, sensors->Name());

  Periodically poll(config.poll_seconds);

  printf("Street light controller on http://0.0.0.0:%d\n"
         "Sensors: %s. Auto mode: %s. Background poll: %s.\n",
         config.port, sensors->Name(),
         config.auto_mode ? "ENABLED" : "DISABLED",
         poll.Enabled() ?
         StringPrintf("every %ds", config.poll_seconds).c_str() : "off");

  {
    Server server(config, &api);

    while (!should_die) {
      if (poll.ShouldRun()) {
        reconciler.ReconcileAll();
        const LightTable table = store.Snapshot();
        const SystemStats stats =
          ComputeStats(table, config.current_warning_amps);
        printf("%s\n", StatusSummary(table, stats).c_str());
        fflush(stdout);
      }
      usleep(100000);
    }

    LOG(INFO) << "Shutting down.";
  }

  // Lights go dark when the controller isn't running. For hardware,
  // the adapter's destructor also releases the GPIO peripheral.
  sensors->AllOff();
  sensors.reset();
  printf("Goodbye.\n");
  return 0;
}
