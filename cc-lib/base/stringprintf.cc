#include "base/stringprintf.h"

#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <vector>

using namespace std;

void StringAppendV(string *dst, const char *format, va_list ap) {
  // Most strings fit here.
  char space[1024];

  va_list backup_ap;
  va_copy(backup_ap, ap);
  int result = vsnprintf(space, sizeof (space), format, backup_ap);
  va_end(backup_ap);

  if (result < 0) return;

  if (result < (int)sizeof (space)) {
    dst->append(space, result);
    return;
  }

  // Exact size is known now.
  vector<char> buf(result + 1);
  va_copy(backup_ap, ap);
  result = vsnprintf(buf.data(), buf.size(), format, backup_ap);
  va_end(backup_ap);

  if (result >= 0 && result < (int)buf.size())
    dst->append(buf.data(), result);
}

string StringPrintf(const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  string result;
  StringAppendV(&result, format, ap);
  va_end(ap);
  return result;
}

void StringAppendF(string *dst, const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  StringAppendV(dst, format, ap);
  va_end(ap);
}
