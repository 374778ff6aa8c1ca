#include "http.h"

#include <string>

#include "util.h"

using namespace std;

const string *HttpRequest::GetHeader(const string &name) const {
  const string lname = Util::lcase(name);
  for (const auto &p : headers) {
    if (Util::lcase(p.first) == lname) return &p.second;
  }
  return nullptr;
}

string HttpRequest::PathOnly() const {
  const size_t q = path.find('?');
  if (q == string::npos) return path;
  return path.substr(0, q);
}
