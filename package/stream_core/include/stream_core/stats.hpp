#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stream_core {

// P(X >= threshold) for X ~ Poisson(lambda).
double poisson_tail(double lambda, int threshold);

// Normal CDF at x for N(mean, stddev^2).
double normal_cdf(double x, double mean, double stddev);

// Inverse standard normal CDF, p in (0, 1).
double normal_quantile(double p);

// Linear-interpolated percentile, q in [0, 100]. Empty input returns 0.
double percentile(std::vector<double> values, double q);

// splitmix64-style mixing to decorrelate seeds
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

// FNV-1a, used to turn identities into seed material.
inline std::uint64_t hash_id(const std::string &id) {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (const char c : id) {
    h ^= static_cast<unsigned char>(c);
    h *= 0x100000001b3ULL;
  }
  return h;
}

} // namespace stream_core
