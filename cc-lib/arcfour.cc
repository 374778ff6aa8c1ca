#include "arcfour.h"

#include <cstdint>
#include <string>
#include <vector>

using namespace std;

ArcFour::ArcFour(const vector<uint8_t> &v) {
  Init(v.data(), v.size());
}

ArcFour::ArcFour(const string &s) {
  Init((const uint8_t *)s.data(), s.size());
}

void ArcFour::Init(const uint8_t *key, size_t len) {
  for (int i = 0; i < 256; i++) ss[i] = i;

  // Empty key behaves like a single zero byte.
  static constexpr uint8_t ZERO = 0;
  if (len == 0) {
    key = &ZERO;
    len = 1;
  }

  uint8_t j = 0;
  for (int i = 0; i < 256; i++) {
    j += ss[i] + key[i % len];
    const uint8_t t = ss[i];
    ss[i] = ss[j];
    ss[j] = t;
  }
  ii = jj = 0;
}

void ArcFour::Discard(int n) {
  for (int i = 0; i < n; i++) (void)Byte();
}
