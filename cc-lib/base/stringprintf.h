#ifndef _CC_LIB_BASE_STRINGPRINTF_H
#define _CC_LIB_BASE_STRINGPRINTF_H

#include <stdarg.h>
#include <string>

// Like sprintf, but returns a std::string.
std::string StringPrintf(const char *format, ...)
  __attribute__((format(printf, 1, 2)));

// Append the formatted output to *dst.
void StringAppendF(std::string *dst, const char *format, ...)
  __attribute__((format(printf, 2, 3)));

// va_list version of the above.
void StringAppendV(std::string *dst, const char *format, va_list ap);

#endif
