#include "http-server.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <sys/time.h>
#include <utility>
#include <vector>

#include <event2/buffer.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/thread.h>

#include "base/logging.h"
#include "util.h"

using namespace std;

HttpServer::~HttpServer() {}

namespace {

struct EvHttpServer : public HttpServer {
  EvHttpServer() {
    // Stop is called from other threads.
    CHECK(evthread_use_pthreads() == 0);
    base = event_base_new();
    CHECK(base != nullptr) << "event_base_new failed";
    http = evhttp_new(base);
    CHECK(http != nullptr) << "evhttp_new failed";
    evhttp_set_allowed_methods(http,
                               EVHTTP_REQ_GET | EVHTTP_REQ_POST |
                               EVHTTP_REQ_HEAD | EVHTTP_REQ_OPTIONS);
    evhttp_set_gencb(http, &EvHttpServer::Callback, this);

    // Stop can come before the loop is running, which loopbreak alone
    // would miss, so poll for it.
    stop_timer = event_new(base, -1, EV_PERSIST,
                           &EvHttpServer::StopTimer, this);
    CHECK(stop_timer != nullptr);
    struct timeval tv = {0, 250000};
    CHECK(event_add(stop_timer, &tv) == 0);
  }

  ~EvHttpServer() override {
    event_free(stop_timer);
    evhttp_free(http);
    event_base_free(base);
  }

  bool ListenOn(uint16_t port) override {
    if (evhttp_bind_socket_with_handle(http, "0.0.0.0", port) == nullptr) {
      LOG(ERROR) << "Couldn't bind port " << port;
      return false;
    }
    LOG(INFO) << "Listening on port " << port;
    if (event_base_dispatch(base) < 0) {
      LOG(ERROR) << "event_base_dispatch failed";
      return false;
    }
    return true;
  }

  void Stop() override {
    stopped.store(true);
    event_base_loopbreak(base);
  }

  void AddHandler(const string &prefix, HttpHandler handler) override {
    handlers.emplace_back(prefix, std::move(handler));
  }

private:
  static void StopTimer(evutil_socket_t, short, void *arg) {
    EvHttpServer *self = (EvHttpServer *)arg;
    if (self->stopped.load()) event_base_loopbreak(self->base);
  }

  static const char *MethodString(evhttp_cmd_type cmd) {
    switch (cmd) {
    case EVHTTP_REQ_GET: return "GET";
    case EVHTTP_REQ_POST: return "POST";
    case EVHTTP_REQ_HEAD: return "HEAD";
    case EVHTTP_REQ_OPTIONS: return "OPTIONS";
    default: return "UNKNOWN";
    }
  }

  static void Callback(struct evhttp_request *ereq, void *arg) {
    EvHttpServer *self = (EvHttpServer *)arg;

    HttpRequest request;
    request.method = MethodString(evhttp_request_get_command(ereq));
    const char *uri = evhttp_request_get_uri(ereq);
    request.path = uri != nullptr ? uri : "/";

    struct evkeyvalq *in_headers = evhttp_request_get_input_headers(ereq);
    for (struct evkeyval *h = in_headers->tqh_first;
         h != nullptr; h = h->next.tqe_next) {
      request.headers.emplace_back(h->key, h->value);
    }

    struct evbuffer *in = evhttp_request_get_input_buffer(ereq);
    const size_t len = evbuffer_get_length(in);
    if (len > 0) {
      request.body.resize(len);
      if (evbuffer_copyout(in, request.body.data(), len) != (ev_ssize_t)len) {
        LOG(WARNING) << "Short read of request body";
        request.body.clear();
      }
    }

    HttpResponse response = self->Dispatch(request);

    struct evkeyvalq *out_headers = evhttp_request_get_output_headers(ereq);
    evhttp_add_header(out_headers, "Content-Type",
                      response.content_type.c_str());
    for (const auto &p : response.extra_headers) {
      evhttp_add_header(out_headers, p.first.c_str(), p.second.c_str());
    }

    struct evbuffer *out = evbuffer_new();
    CHECK(out != nullptr);
    evbuffer_add(out, response.body.data(), response.body.size());
    evhttp_send_reply(ereq, response.code, response.status.c_str(), out);
    evbuffer_free(out);
  }

  HttpResponse Dispatch(const HttpRequest &request) const {
    const string path = request.PathOnly();
    for (const auto &p : handlers) {
      if (Util::StartsWith(path, p.first)) return p.second(request);
    }
    HttpResponse r;
    r.code = 404;
    r.status = "Not Found";
    r.body = "Not found\n";
    return r;
  }

  struct event_base *base = nullptr;
  struct evhttp *http = nullptr;
  struct event *stop_timer = nullptr;
  std::atomic<bool> stopped{false};
  vector<pair<string, HttpHandler>> handlers;
};

}  // namespace

HttpServer *HttpServer::Create() {
  return new EvHttpServer;
}
