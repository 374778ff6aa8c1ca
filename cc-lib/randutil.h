#ifndef _CC_LIB_RANDUTIL_H
#define _CC_LIB_RANDUTIL_H

#include <cstdint>
#include <vector>
#include <utility>

#include "arcfour.h"

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint64 = uint64_t;
using uint32 = uint32_t;

// In [0, 1].
inline double RandDouble(ArcFour *rc) {
  uint64 uu = 0U;
  for (int i = 0; i < 8; i++)
    uu = rc->Byte() | (uu << 8);
  return ((uu &   0x3FFFFFFFFFFFFFFFULL) /
          (double)0x3FFFFFFFFFFFFFFFULL);
};

// Uniform in [lo, hi].
inline double RandDoubleIn(ArcFour *rc, double lo, double hi) {
  return lo + RandDouble(rc) * (hi - lo);
}

inline uint32 Rand32(ArcFour *rc) {
  uint32 uu = 0ULL;
  uu = rc->Byte() | (uu << 8);
  uu = rc->Byte() | (uu << 8);
  uu = rc->Byte() | (uu << 8);
  uu = rc->Byte() | (uu << 8);
  return uu;
};

// Generate uniformly distributed numbers in [0, n - 1].
// n must be at least 1.
inline uint32 RandTo32(ArcFour *rc, uint32 n) {
  // Rejection sampling with a modulus that's the next power of two,
  // so we succeed at least half the time.
  uint32 mask = n - 1;
  mask |= mask >> 1;
  mask |= mask >> 2;
  mask |= mask >> 4;
  mask |= mask >> 8;
  mask |= mask >> 16;

  for (;;) {
    const uint32 x = Rand32(rc) & mask;
    if (x < n) return x;
  }
}

// Uniform integer in [lo, hi], inclusive.
inline int RandIntIn(ArcFour *rc, int lo, int hi) {
  return lo + (int)RandTo32(rc, (uint32)(hi - lo + 1));
}

// Fair coin.
inline bool RandBool(ArcFour *rc) {
  return !!(rc->Byte() & 1);
}

#endif
