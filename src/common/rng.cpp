#include "common/rng.h"
#include <algorithm>

namespace vaultsim {
namespace common {

SeededRng::SeededRng(uint64_t seed) : seed_(seed), engine_(seed) {}

uint64_t SeededRng::next_u64() { return engine_(); }

size_t SeededRng::gen_range(size_t low, size_t high) {
  std::uniform_int_distribution<size_t> dist(low, high - 1);
  return dist(engine_);
}

bool SeededRng::gen_bool() { return (engine_() & 1) == 1; }

Bytes SeededRng::gen_bytes(size_t size) {
  Bytes bytes(size);
  size_t i = 0;
  while (i < size) {
    uint64_t word = engine_();
    for (int b = 0; b < 8 && i < size; ++b, ++i) {
      bytes[i] = static_cast<uint8_t>(word >> (b * 8));
    }
  }
  return bytes;
}

XorName SeededRng::gen_name() {
  XorName name{};
  Bytes bytes = gen_bytes(XOR_NAME_LEN);
  std::copy(bytes.begin(), bytes.end(), name.begin());
  return name;
}

SeededRng SeededRng::fork() {
  // Mix so that consecutive forks do not produce correlated streams
  uint64_t child = engine_() ^ 0x9e3779b97f4a7c15ULL;
  child ^= child >> 33;
  child *= 0xff51afd7ed558ccdULL;
  child ^= child >> 33;
  return SeededRng(child);
}

} // namespace common
} // namespace vaultsim
