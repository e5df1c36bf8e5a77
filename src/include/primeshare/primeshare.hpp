#pragma once
#ifndef PRIMESHARE_HPP__
#define PRIMESHARE_HPP__

#include <climits>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "primeshare/basecodec.hpp"
#include "primeshare/errors.hpp"
#include "primeshare/field.hpp"
#include "primeshare/polynomial.hpp"
#include "primeshare/randomsource.hpp"
#include "primeshare/sharecodec.hpp"

namespace PrimeShare {
  class Scheme {
   public:
    explicit Scheme(uint64_t m, uint64_t k, std::shared_ptr<RandomSource> random = {})
        : m_(m),
          k_(k),
          field_(Field::forShareCount(m)),
          alphabet_(Alphabet::shareAlphabet()),
          random_(random ? std::move(random) : std::shared_ptr<RandomSource>(std::make_shared<DeviceRandomSource>())) {
      if (m_ >= field_->prime())
        throw RangeError(std::format("Number of shares has to be below {}", field_->prime()));
      if (k_ < 2 || k_ > m_) throw RangeError(std::format("Threshold has to be between 2 and {}", m_));
    }

    uint64_t shareCount() const { return m_; }
    uint64_t threshold() const { return k_; }
    const std::shared_ptr<const Field> &field() const { return field_; }

    std::vector<std::string> split(std::span<const uint8_t> secret, RandomSource &random) const {
      const auto byteWidth = field_->byteWidth();
      const auto chunks = (secret.size() + byteWidth - 1) / byteWidth;

      std::vector<ShareRecord> records(m_);
      for (uint64_t x = 1; x <= m_; x++) {
        auto &record = records[x - 1];
        record.byteWidth = byteWidth;
        record.threshold = k_;
        record.index = x;
        record.padding = chunks * byteWidth - secret.size();
        record.values.reserve(chunks);
      }

      for (std::size_t offset = 0; offset < secret.size(); offset += byteWidth) {
        auto coefficients = Polynomial::generateCoefficients(k_, *field_, random);
        coefficients.push_back(chunkValue(secret, offset, byteWidth));

        for (auto &record : records)
          record.values.push_back(Polynomial::evaluate(record.index, coefficients, *field_));
      }

      std::vector<std::string> outputs;
      outputs.reserve(m_);
      for (const auto &record : records) outputs.push_back(ShareCodec::encode(record, alphabet_));
      return outputs;
    }

    std::vector<std::string> split(std::span<const uint8_t> secret) const { return split(secret, *random_); }

    /*
     * With a caller supplied ranbuf the coefficients come from its bytes instead of this scheme's
     * random source, eight bytes per draw. A buffer too short for the secret throws RangeError.
     */
    void split(const std::shared_ptr<uint8_t[]> &input, std::size_t len, std::vector<std::string> &outputs,
               const std::shared_ptr<uint8_t[]> &ranbuf = {}, std::size_t ranlen = 0) const {
      if (ranbuf) {
        BufferRandomSource source(ranbuf, ranlen);
        outputs = split(std::span<const uint8_t>(input.get(), len), source);
      } else {
        outputs = split(std::span<const uint8_t>(input.get(), len));
      }
    }

    // reuses this scheme's inverse table when the shares were made with the same prime
    std::vector<uint8_t> recover(const std::vector<std::string> &shares) const {
      auto records = decodeAll(shares);
      if (records.front().byteWidth == field_->byteWidth()) return reconstruct(records, *field_);
      return reconstruct(records, Field(records.front().byteWidth));
    }

    // recover without a scheme at hand; everything needed is in the share headers
    static std::vector<uint8_t> join(const std::vector<std::string> &shares) {
      auto records = decodeAll(shares);
      return reconstruct(records, Field(records.front().byteWidth));
    }

    static ShareRecord describe(const std::string &share) {
      return ShareCodec::decode(share, Alphabet::shareAlphabet());
    }

   private:
    uint64_t m_;
    uint64_t k_;
    std::shared_ptr<const Field> field_;
    Alphabet alphabet_;
    std::shared_ptr<RandomSource> random_;

    // little-endian; bytes past the end of the secret count as zero
    static uint64_t chunkValue(std::span<const uint8_t> secret, std::size_t offset, unsigned byteWidth) {
      uint64_t n = 0;
      for (auto i{0u}; i < byteWidth && offset + i < secret.size(); i++)
        n |= uint64_t{secret[offset + i]} << (i * CHAR_BIT);
      return n;
    }

    static std::vector<ShareRecord> decodeAll(const std::vector<std::string> &shares) {
      if (shares.empty()) throw EmptyInputError("No shares given");

      const auto alphabet = Alphabet::shareAlphabet();
      std::vector<ShareRecord> records;
      records.reserve(shares.size());
      for (const auto &share : shares) records.push_back(ShareCodec::decode(share, alphabet));

      const auto &first = records.front();
      for (const auto &record : records) {
        if (record.byteWidth != first.byteWidth || record.threshold != first.threshold)
          throw IncompatibleSharesError("Given shares are incompatible");
        if (record.values.size() != first.values.size() || record.padding != first.padding)
          throw IncompatibleSharesError("Given shares vary in length");
      }

      if (records.size() < first.threshold)
        throw InsufficientSharesError(
            std::format("Not enough shares to disclose the secret: {} given, {} needed", records.size(), first.threshold));

      return records;
    }

    /*
     * Every supplied share takes part: interpolating through more than threshold points of a
     * polynomial of degree threshold - 1 still yields that polynomial, and a duplicate anywhere
     * in the input shows up as a zero weight. The weights depend only on the indices, so they
     * are computed once and reused for each chunk.
     */
    static std::vector<uint8_t> reconstruct(const std::vector<ShareRecord> &records, const Field &field) {
      const auto &first = records.front();
      const auto byteWidth = first.byteWidth;
      const uint64_t chunkLimit = uint64_t{1} << (byteWidth * CHAR_BIT);

      std::vector<uint64_t> xs;
      xs.reserve(records.size());
      for (const auto &record : records) xs.push_back(record.index);

      auto weights = Polynomial::reverseCoefficients(xs, field);

      std::vector<uint8_t> secret;
      secret.reserve(first.values.size() * byteWidth);

      std::vector<uint64_t> ys(records.size());
      for (auto chunk{0u}; chunk < first.values.size(); chunk++) {
        for (auto i{0u}; i < records.size(); i++) ys[i] = records[i].values[chunk];

        auto value = Polynomial::interpolate(ys, weights, field);
        if (value >= chunkLimit) throw MalformedShareError("Reconstructed chunk does not fit its byte width");

        for (auto b{0u}; b < byteWidth; b++) {
          secret.push_back(static_cast<uint8_t>(value & 0xff));
          value >>= CHAR_BIT;
        }
      }

      // strip the zero bytes the last chunk was padded with
      secret.resize(secret.size() - first.padding);
      return secret;
    }
  };
};  // namespace PrimeShare
#endif
