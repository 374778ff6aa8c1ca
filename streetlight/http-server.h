// Embedded HTTP server on libevent's evhttp. One event loop thread
// (the one that calls ListenOn) runs every handler.

#ifndef _STREETLIGHT_HTTP_SERVER_H
#define _STREETLIGHT_HTTP_SERVER_H

#include <cstdint>
#include <string>

#include "http.h"

struct HttpServer {
  static HttpServer *Create();
  virtual ~HttpServer();

  // If successful, keeps serving until Stop is called (e.g. in
  // another thread), and then returns true.
  // Returns false on failure (e.g. port already in use).
  virtual bool ListenOn(uint16_t port) = 0;

  // Thread-safe. ListenOn returns soon after.
  virtual void Stop() = 0;

  // Handlers are checked in the order that they are added. The first
  // one whose prefix matches the request path gets it. Register "/"
  // last to catch everything else. Not thread-safe; add handlers
  // before listening.
  virtual void AddHandler(const std::string &prefix, HttpHandler handler) = 0;

protected:
  // Use factory method.
  HttpServer() {}
};

#endif
