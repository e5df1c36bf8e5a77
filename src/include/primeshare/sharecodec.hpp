#ifndef PRIMESHARE_SHARECODEC_HPP__
#define PRIMESHARE_SHARECODEC_HPP__
#include <charconv>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "primeshare/basecodec.hpp"
#include "primeshare/errors.hpp"
#include "primeshare/field.hpp"

namespace PrimeShare {
  // one decoded share: header fields plus one field element per secret chunk
  struct ShareRecord {
    unsigned byteWidth{0};
    uint64_t threshold{0};
    uint64_t index{0};
    std::vector<uint64_t> values;
    std::size_t padding{0};  // zero bytes appended to the last chunk
  };

  /*
   * Positions within a share string. Every field after the leading byte width digit
   * has the same width, which depends only on the byte width:
   *
   *   [w][threshold: L][index: L][value 1: L]...[value n: L][pad symbols]
   */
  struct ShareLayout {
    unsigned byteWidth;
    std::size_t fieldWidth;

    static ShareLayout forByteWidth(unsigned byteWidth, const Alphabet &alphabet) {
      primeForByteWidth(byteWidth);  // throws RangeError for unsupported widths
      return {byteWidth, maxEncodedLength(byteWidth, alphabet)};
    }

    std::size_t thresholdOffset() const { return 1; }
    std::size_t indexOffset() const { return thresholdOffset() + fieldWidth; }
    std::size_t bodyOffset() const { return indexOffset() + fieldWidth; }
    std::size_t valueOffset(std::size_t chunk) const { return bodyOffset() + chunk * fieldWidth; }
    std::size_t shareLength(std::size_t chunks, std::size_t padding) const { return valueOffset(chunks) + padding; }
  };
};  // namespace PrimeShare

namespace PrimeShare::ShareCodec {
  inline std::string encode(const ShareRecord &record, const Alphabet &alphabet) {
    auto layout = ShareLayout::forByteWidth(record.byteWidth, alphabet);

    std::string share;
    share.reserve(layout.shareLength(record.values.size(), record.padding));

    share += std::format("{:x}", record.byteWidth);
    share += encodeField(record.threshold, layout.fieldWidth, alphabet);
    share += encodeField(record.index, layout.fieldWidth, alphabet);
    for (auto y : record.values) share += encodeField(y, layout.fieldWidth, alphabet);
    share.append(record.padding, alphabet.pad());

    return share;
  }

  namespace detail {
    inline uint64_t decodeChecked(std::string_view symbols, std::string_view name, const Alphabet &alphabet) {
      try {
        return decodeField(symbols, alphabet);
      } catch (const std::invalid_argument &e) {
        throw MalformedShareError(std::format("Unreadable {} field '{}': {}", name, symbols, e.what()));
      } catch (const RangeError &e) {
        throw MalformedShareError(std::format("Unreadable {} field '{}': {}", name, symbols, e.what()));
      }
    }
  };  // namespace detail

  inline ShareRecord decode(std::string_view text, const Alphabet &alphabet) {
    if (text.empty()) throw MalformedShareError("Share is empty");

    unsigned byteWidth = 0;
    auto parsed = std::from_chars(text.data(), text.data() + 1, byteWidth, 16);
    if (parsed.ec != std::errc() || byteWidth < 1 || byteWidth > maxByteWidth)
      throw MalformedShareError(std::format("Invalid byte width digit '{}'", text[0]));

    auto layout = ShareLayout::forByteWidth(byteWidth, alphabet);
    const auto prime = primeForByteWidth(byteWidth);

    if (text.size() < layout.bodyOffset())
      throw MalformedShareError(std::format("Share is shorter than its {} character header", layout.bodyOffset()));

    ShareRecord record;
    record.byteWidth = byteWidth;
    record.threshold = detail::decodeChecked(text.substr(layout.thresholdOffset(), layout.fieldWidth), "threshold", alphabet);
    record.index = detail::decodeChecked(text.substr(layout.indexOffset(), layout.fieldWidth), "index", alphabet);

    if (record.threshold < 2 || record.threshold >= prime)
      throw MalformedShareError(std::format("Threshold {} out of range", record.threshold));
    if (record.index < 1 || record.index >= prime)
      throw MalformedShareError(std::format("Share index {} out of range", record.index));

    auto body = text.substr(layout.bodyOffset());
    auto values = body;
    while (!values.empty() && values.back() == alphabet.pad()) values.remove_suffix(1);
    record.padding = body.size() - values.size();

    if (values.find(alphabet.pad()) != std::string_view::npos)
      throw MalformedShareError("Padding symbol in the middle of the share body");
    if (values.size() % layout.fieldWidth)
      throw MalformedShareError(
          std::format("Share body length {} is not a multiple of {}", values.size(), layout.fieldWidth));
    if (record.padding >= byteWidth || (record.padding && values.empty()))
      throw MalformedShareError(std::format("Invalid padding count {}", record.padding));

    const auto chunks = values.size() / layout.fieldWidth;
    record.values.reserve(chunks);
    for (auto i{0u}; i < chunks; i++) {
      auto y = detail::decodeChecked(values.substr(i * layout.fieldWidth, layout.fieldWidth), "value", alphabet);
      if (y >= prime) throw MalformedShareError(std::format("Value {} is not an element of the field", y));
      record.values.push_back(y);
    }

    return record;
  }
};  // namespace PrimeShare::ShareCodec
#endif
