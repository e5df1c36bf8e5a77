#ifndef PRIMESHARE_RANDOMSOURCE_HPP__
#define PRIMESHARE_RANDOMSOURCE_HPP__
#include <climits>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>

#include "primeshare/errors.hpp"

namespace PrimeShare {
  // supplies the raw integers polynomial coefficients are drawn from
  class RandomSource {
   public:
    virtual ~RandomSource() = default;
    virtual uint64_t next() = 0;
  };

  class DeviceRandomSource : public RandomSource {
   public:
    uint64_t next() override {
      static_assert(std::numeric_limits<std::random_device::result_type>::digits == 32);
      return (uint64_t{device_()} << 32) | device_();
    }

   private:
    std::random_device device_;
  };

  /*
   * Hands out caller supplied random data, eight bytes (little-endian) per call.
   * Throws RangeError once the buffer runs dry.
   */
  class BufferRandomSource : public RandomSource {
   public:
    explicit BufferRandomSource(const std::shared_ptr<uint8_t[]> &ranbuf, std::size_t len)
        : ranbuf_(ranbuf), len_(len), pos_(0) {}

    uint64_t next() override {
      if (len_ - pos_ < sizeof(uint64_t)) throw RangeError("Random buffer exhausted");

      uint64_t n = 0;
      for (auto i{0u}; i < sizeof(uint64_t); i++) n |= uint64_t{ranbuf_[pos_ + i]} << (i * CHAR_BIT);
      pos_ += sizeof(uint64_t);
      return n;
    }

   private:
    std::shared_ptr<uint8_t[]> ranbuf_;
    std::size_t len_;
    std::size_t pos_;
  };
};  // namespace PrimeShare
#endif
