// HTTP request and response, independent of the server that carries
// them so that handlers can be called directly.

#ifndef _STREETLIGHT_HTTP_H
#define _STREETLIGHT_HTTP_H

#include <functional>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
  // GET, POST, ...
  std::string method;
  // Path and query, e.g. /api/data?x=1
  std::string path;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // Find a header's value (case insensitive) or return nullptr.
  const std::string *GetHeader(const std::string &name) const;
  // The path without any query string.
  std::string PathOnly() const;
};

struct HttpResponse {
  // e.g. 404
  int code = 200;
  // e.g. "Not Found"
  std::string status = "OK";
  // e.g. "application/json"
  std::string content_type = "text/plain; charset=UTF-8";
  std::string body;
  std::vector<std::pair<std::string, std::string>> extra_headers;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest &)>;

#endif
