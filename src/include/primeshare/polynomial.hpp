#ifndef PRIMESHARE_POLYNOMIAL_HPP__
#define PRIMESHARE_POLYNOMIAL_HPP__
#include <cstdint>
#include <vector>

#include "primeshare/errors.hpp"
#include "primeshare/field.hpp"
#include "primeshare/randomsource.hpp"

namespace PrimeShare::Polynomial {
  // threshold - 1 random nonzero draws, reduced into the field; the caller appends the constant term
  inline std::vector<uint64_t> generateCoefficients(uint64_t threshold, const Field &field, RandomSource &random) {
    std::vector<uint64_t> coefficients;
    if (threshold < 2) return coefficients;

    coefficients.reserve(threshold);
    for (uint64_t i = 1; i < threshold; i++) {
      uint64_t n;
      do {
        n = random.next();
      } while (n == 0);
      coefficients.push_back(field.reduce(n));
    }
    return coefficients;
  }

  /*
   * Horner's method. Coefficients are ordered highest degree first, so
   * {c0, c1, c2} evaluates c0 * x^2 + c1 * x + c2.
   */
  inline uint64_t evaluate(uint64_t x, const std::vector<uint64_t> &coefficients, const Field &field) {
    uint64_t y = 0;
    for (auto c : coefficients) y = field.add(field.mul(y, x), c);
    return y;
  }

  /*
   * Lagrange weights for interpolating at x = 0 from the points xs:
   *
   *   w_i = prod_{j != i} (-x_j) * (x_i - x_j)^-1  (mod p)
   *
   * Each weight of a distinct point set is nonzero, and inverse(0) is 0, so a zero weight means
   * two of the points coincide. All xs must lie in [1, p).
   */
  inline std::vector<uint64_t> reverseCoefficients(const std::vector<uint64_t> &xs, const Field &field) {
    std::vector<uint64_t> weights;
    weights.reserve(xs.size());

    for (auto i{0u}; i < xs.size(); i++) {
      uint64_t w = 1;
      for (auto j{0u}; j < xs.size(); j++) {
        if (j == i) continue;
        auto diff = static_cast<int64_t>(xs[i]) - static_cast<int64_t>(xs[j]);
        w = field.mul(field.mul(w, field.negate(xs[j])), field.inverse(diff));
      }

      if (w == 0) throw DuplicateShareError("Repeated share detected, cannot compute reverse coefficients");

      weights.push_back(w);
    }
    return weights;
  }

  inline uint64_t interpolate(const std::vector<uint64_t> &ys, const std::vector<uint64_t> &weights,
                              const Field &field) {
    uint64_t secret = 0;
    for (auto i{0u}; i < ys.size() && i < weights.size(); i++) secret = field.add(secret, field.mul(ys[i], weights[i]));
    return secret;
  }
};  // namespace PrimeShare::Polynomial
#endif
