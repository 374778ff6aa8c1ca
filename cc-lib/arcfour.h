// The ARCFOUR keystream generator, used as a fast, seedable source of
// pseudorandom bytes. Not for cryptographic use; the early bytes of
// the stream are biased (see Discard).

#ifndef _CC_LIB_ARCFOUR_H
#define _CC_LIB_ARCFOUR_H

#include <cstdint>
#include <string>
#include <vector>

struct ArcFour {
  explicit ArcFour(const std::vector<uint8_t> &v);
  explicit ArcFour(const std::string &s);

  // Next byte of the stream.
  inline uint8_t Byte() {
    ii++;
    jj += ss[ii];
    const uint8_t t = ss[ii];
    ss[ii] = ss[jj];
    ss[jj] = t;
    return ss[(uint8_t)(ss[ii] + ss[jj])];
  }

  // Skip n bytes of the stream.
  void Discard(int n);

private:
  void Init(const uint8_t *key, size_t len);

  uint8_t ii = 0, jj = 0;
  uint8_t ss[256];
};

#endif
