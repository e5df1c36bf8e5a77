#ifndef PRIMESHARE_FIELD_HPP__
#define PRIMESHARE_FIELD_HPP__
#include <algorithm>
#include <bit>
#include <boost/multiprecision/cpp_int.hpp>
#include <climits>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "primeshare/errors.hpp"

namespace PrimeShare {
  namespace mp = boost::multiprecision;

  inline constexpr unsigned maxByteWidth = 7;

  // one byte of the widest integer stays free for the prime
  inline constexpr uint64_t maxShareCount = uint64_t{1} << (maxByteWidth * CHAR_BIT);

  // smallest usable prime above 256^n, indexed by n
  inline constexpr uint64_t primeTable[maxByteWidth + 1] = {0,
                                                            257,
                                                            65537,
                                                            16777259,
                                                            4294967311,
                                                            1099511627791,
                                                            281474976710677,
                                                            72057594037928017};

  // primes up to this size get a precomputed inverse table
  inline constexpr uint64_t inverseTableLimit = 65537;

  // 3 is a primitive root of both 257 and 65537
  inline constexpr uint64_t inverseTableGenerator = 3;

  struct PrimeSelection {
    uint64_t prime;
    unsigned byteWidth;
  };

  inline PrimeSelection selectPrime(uint64_t shareCount) {
    if (shareCount == 0) throw RangeError("Number of shares must be at least 1");
    if (shareCount > maxShareCount)
      throw RangeError(std::format("Number of shares must not exceed {}", maxShareCount));

    // ceil(log2(shareCount) / 8), at least one byte
    auto bits = shareCount > 1 ? static_cast<unsigned>(std::bit_width(shareCount - 1)) : 0u;
    auto byteWidth = std::max(1u, (bits + CHAR_BIT - 1) / CHAR_BIT);

    if (byteWidth > maxByteWidth)
      throw RangeError(std::format("Primes wider than {} bytes are not implemented", maxByteWidth));

    return {primeTable[byteWidth], byteWidth};
  }

  inline uint64_t primeForByteWidth(unsigned byteWidth) {
    if (byteWidth < 1 || byteWidth > maxByteWidth)
      throw RangeError(std::format("Byte width must be between 1 and {}, got {}", maxByteWidth, byteWidth));
    return primeTable[byteWidth];
  }

  // Euclidean remainder, always in [0, p)
  inline uint64_t modulo(int64_t n, uint64_t p) {
    auto r = n % static_cast<int64_t>(p);
    return static_cast<uint64_t>(r < 0 ? r + static_cast<int64_t>(p) : r);
  }

  /*
   * Arithmetic modulo one of the primes in primeTable. Products go through a 128 bit
   * intermediate, since elements of the wider primes use up to 57 bits.
   *
   * The inverse table is built on the first call to inverse() and never changes after
   * that, so a Field can be shared read-only between threads. Primes above
   * inverseTableLimit use the extended Euclidean algorithm per lookup instead.
   */
  class Field {
   public:
    explicit Field(unsigned byteWidth) : prime_(primeForByteWidth(byteWidth)), byteWidth_(byteWidth) {}
    explicit Field(const PrimeSelection &selection) : prime_(selection.prime), byteWidth_(selection.byteWidth) {}

    Field(const Field &) = delete;
    Field &operator=(const Field &) = delete;

    static std::shared_ptr<const Field> forShareCount(uint64_t shareCount) {
      return std::make_shared<Field>(selectPrime(shareCount));
    }

    uint64_t prime() const { return prime_; }
    unsigned byteWidth() const { return byteWidth_; }

    uint64_t reduce(uint64_t n) const { return n % prime_; }

    uint64_t add(uint64_t a, uint64_t b) const { return (a + b) % prime_; }

    uint64_t sub(uint64_t a, uint64_t b) const { return a >= b ? a - b : a + prime_ - b; }

    uint64_t negate(uint64_t a) const { return a == 0 ? 0 : prime_ - a; }

    uint64_t mul(uint64_t a, uint64_t b) const {
      return static_cast<uint64_t>((mp::uint128_t(a) * b) % prime_);
    }

    // i^-1 mod p for i in (-p, p); inverse(0) is 0 by convention
    uint64_t inverse(int64_t i) const {
      if (i < 0) return modulo(-static_cast<int64_t>(lookup(static_cast<uint64_t>(-i))), prime_);
      return lookup(static_cast<uint64_t>(i));
    }

    bool hasInverseTable() const { return prime_ <= inverseTableLimit; }

   private:
    uint64_t prime_;
    unsigned byteWidth_;
    mutable std::once_flag tableOnce_;
    mutable std::vector<uint32_t> table_;

    uint64_t lookup(uint64_t i) const {
      i %= prime_;
      if (!hasInverseTable()) return euclideanInverse(i);

      std::call_once(tableOnce_, [this] { buildInverseTable(); });
      return table_[i];
    }

    // walk the cycle of the generator: x = g^n, y = g^-n
    void buildInverseTable() const {
      const auto step = inverseTableGenerator;
      const auto inverseStep = euclideanInverse(step);

      table_.assign(prime_, 0);
      uint64_t x = 1, y = 1;
      for (uint64_t n = 1; n < prime_; n++) {
        table_[x] = static_cast<uint32_t>(y);
        x = mul(x, step);
        y = mul(y, inverseStep);
      }
    }

    uint64_t euclideanInverse(uint64_t a) const {
      int64_t t = 0, newT = 1;
      auto r = static_cast<int64_t>(prime_), newR = static_cast<int64_t>(a);

      while (newR != 0) {
        auto q = r / newR;
        t = std::exchange(newT, t - q * newT);
        r = std::exchange(newR, r - q * newR);
      }

      // a == 0 leaves t at 0
      return modulo(t, prime_);
    }
  };
};  // namespace PrimeShare
#endif
