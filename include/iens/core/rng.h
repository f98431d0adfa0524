#pragma once
// iens/core/rng.h
//
// Reproducible RNG and seed derivation.
// splitmix64 expands seeds, xoshiro256** generates. Per-run streams are
// derived from (base_seed, run_index) so that any run of an ensemble can be
// regenerated without replaying the runs before it.

#include "iens/core/types.h"

#include <array>
#include <cstdint>

namespace iens {
namespace detail {

inline constexpr u64 Rotl(const u64 x, int k) noexcept {
  return (x << k) | (x >> (64 - k));
}

class SplitMix64 {
 public:
  explicit SplitMix64(u64 seed) noexcept : state_(seed) {}

  u64 Next() noexcept {
    u64 z = (state_ += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
  }

 private:
  u64 state_;
};

// xoshiro256**: https://prng.di.unimi.it/
class Xoshiro256StarStar {
 public:
  Xoshiro256StarStar() noexcept : s_{0, 0, 0, 0} {}

  void Seed(u64 seed) noexcept {
    SplitMix64 sm(seed);
    for (usize i = 0; i < 4; ++i) {
      s_[i] = sm.Next();
    }
    if ((s_[0] | s_[1] | s_[2] | s_[3]) == 0) {
      s_[0] = 0x9e3779b97f4a7c15ULL;
    }
  }

  u64 NextU64() noexcept {
    const u64 result = Rotl(s_[1] * 5ULL, 7) * 9ULL;

    const u64 t = s_[1] << 17;

    s_[2] ^= s_[0];
    s_[3] ^= s_[1];
    s_[1] ^= s_[2];
    s_[0] ^= s_[3];

    s_[2] ^= t;
    s_[3] = Rotl(s_[3], 45);

    return result;
  }

 private:
  std::array<u64, 4> s_;
};

}  // namespace detail

class Rng {
 public:
  explicit Rng(u64 seed = 0) noexcept { Seed(seed); }

  void Seed(u64 seed) noexcept { gen_.Seed(seed); }

  u64 NextU64() noexcept { return gen_.NextU64(); }

  // [0,1) with 53 bits of precision.
  double NextDouble() noexcept {
    const u64 x = NextU64();
    return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);  // 2^53
  }

  // Uniform in [lo, hi). If hi <= lo, returns lo.
  double UniformDouble(double lo, double hi) noexcept {
    if (!(hi > lo)) return lo;
    return lo + (hi - lo) * NextDouble();
  }

 private:
  detail::Xoshiro256StarStar gen_;
};

// splitmix64 finalizer.
inline u64 HashSeed(u64 x) noexcept {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Derive a sub-seed from (master, salt).
inline u64 DeriveSeed(u64 master, u64 salt) noexcept {
  return HashSeed(master ^ (salt + 0xD1B54A32D192ED03ULL));
}

}  // namespace iens
