// Minimal CHECK and LOG macros, in the style of glog.
//
// CHECK(cond) << "message"; aborts with the message if cond is false.
// LOG(INFO) << "message"; writes a line to stderr. LOG(FATAL) aborts
// after writing.

#ifndef _CC_LIB_BASE_LOGGING_H
#define _CC_LIB_BASE_LOGGING_H

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace cclog {

enum Severity {
  INFO = 0,
  WARNING = 1,
  ERROR = 2,
  FATAL = 3,
};

// Accumulates a message and writes it (with a prefix) when destroyed.
// Aborts at destruction if fatal.
class LogMessage {
 public:
  LogMessage(const char *file, int line, Severity sev) :
    sev(sev) {
    static constexpr const char *NAMES = "IWEF";
    stream_ << NAMES[sev] << " " << Basename(file) << ":" << line << "] ";
  }

  ~LogMessage() {
    stream_ << "\n";
    std::cerr << stream_.str();
    std::cerr.flush();
    if (sev == FATAL) abort();
  }

  std::ostream &stream() { return stream_; }

 private:
  static const char *Basename(const char *file) {
    const char *base = file;
    for (const char *p = file; *p; p++)
      if (*p == '/') base = p + 1;
    return base;
  }

  Severity sev = INFO;
  std::ostringstream stream_;
};

// Lets the CHECK macro be an expression of type void on both
// branches of the conditional.
struct Voidify {
  void operator &(std::ostream &) {}
};

}  // namespace cclog

#define LOG(sev) \
  ::cclog::LogMessage(__FILE__, __LINE__, ::cclog::sev).stream()

#define CHECK(cond)                                             \
  (cond) ? (void)0 :                                            \
  ::cclog::Voidify() &                                          \
    ::cclog::LogMessage(__FILE__, __LINE__, ::cclog::FATAL)     \
    .stream() << "Check failed: " #cond " "

#define CHECK_OP_(a, b, op)                                     \
  ((a) op (b)) ? (void)0 :                                      \
  ::cclog::Voidify() &                                          \
    ::cclog::LogMessage(__FILE__, __LINE__, ::cclog::FATAL)     \
    .stream() << "Check failed: " #a " " #op " " #b             \
              << " (" << (a) << " vs. " << (b) << ") "

#define CHECK_EQ(a, b) CHECK_OP_(a, b, ==)
#define CHECK_NE(a, b) CHECK_OP_(a, b, !=)
#define CHECK_LT(a, b) CHECK_OP_(a, b, <)
#define CHECK_LE(a, b) CHECK_OP_(a, b, <=)
#define CHECK_GT(a, b) CHECK_OP_(a, b, >)
#define CHECK_GE(a, b) CHECK_OP_(a, b, >=)

#endif
