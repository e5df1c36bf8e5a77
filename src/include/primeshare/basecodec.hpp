#ifndef PRIMESHARE_BASECODEC_HPP__
#define PRIMESHARE_BASECODEC_HPP__
#include <algorithm>
#include <boost/multiprecision/cpp_int.hpp>
#include <climits>
#include <cstdint>
#include <format>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include "primeshare/errors.hpp"

using namespace std::string_view_literals;

namespace PrimeShare {
  namespace mp = boost::multiprecision;

  inline constexpr auto decimalSymbols = "0123456789"sv;
  inline constexpr auto shareSymbols = "0123456789abcdefghijklmnopqrstuvwxyz.,:;!?*#%"sv;
  inline constexpr char padSymbol = '=';

  static_assert(shareSymbols.find(padSymbol) == std::string_view::npos,
                "padding symbol must not be part of the share alphabet");

  class Alphabet {
   public:
    explicit Alphabet(std::string_view symbols, char pad = padSymbol) : symbols_(symbols), pad_(pad) {
      if (symbols_.size() < 2) throw ConfigurationError("An alphabet needs at least two symbols");
      if (symbols_.find(pad_) != std::string::npos)
        throw ConfigurationError(std::format("Padding symbol '{}' must not be part of the alphabet", pad_));

      std::string sorted(symbols_);
      std::sort(sorted.begin(), sorted.end());
      if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
        throw ConfigurationError("Alphabet symbols must be unique");
    }

    static Alphabet shareAlphabet() { return Alphabet(shareSymbols, padSymbol); }

    const std::string &symbols() const { return symbols_; }
    std::size_t base() const { return symbols_.size(); }
    char zero() const { return symbols_.front(); }
    char pad() const { return pad_; }
    bool contains(char c) const { return symbols_.find(c) != std::string::npos; }

   private:
    std::string symbols_;
    char pad_;
  };

  /*
   * Rewrites a digit string written in one alphabet into another, e.g.
   * convertBase("256", decimalSymbols, shareSymbols) == "5v". The value is held in an
   * arbitrary precision integer, so the length of the input is not limited by any
   * machine word. Zero comes out as the first symbol of the target alphabet, and an
   * empty input reads as zero.
   */
  inline std::string convertBase(std::string_view digits, std::string_view fromAlphabet,
                                 std::string_view toAlphabet) {
    if (fromAlphabet == toAlphabet) return std::string(digits);
    if (fromAlphabet.size() < 2 || toAlphabet.size() < 2)
      throw std::invalid_argument("Alphabets need at least two symbols");

    const auto fromBase = fromAlphabet.size();
    const auto toBase = toAlphabet.size();

    mp::cpp_int value = 0;
    for (auto c : digits) {
      auto digit = fromAlphabet.find(c);
      if (digit == std::string_view::npos)
        throw std::invalid_argument(std::format("Symbol '{}' is not part of the source alphabet", c));
      value = value * fromBase + digit;
    }

    if (value == 0) return std::string(1, toAlphabet.front());

    std::string out;
    while (value != 0) {
      out.push_back(toAlphabet[static_cast<std::size_t>(value % toBase)]);
      value /= toBase;
    }
    std::reverse(out.begin(), out.end());
    return out;
  }

  // symbols needed for 256^byteWidth, which bounds every element of the matching prime field
  inline std::size_t maxEncodedLength(unsigned byteWidth, const Alphabet &alphabet = Alphabet::shareAlphabet()) {
    mp::cpp_int limit = 1;
    limit <<= byteWidth * CHAR_BIT;
    return convertBase(limit.str(), decimalSymbols, alphabet.symbols()).size();
  }

  inline std::string encodeField(uint64_t value, std::size_t width, const Alphabet &alphabet) {
    auto symbols = convertBase(std::to_string(value), decimalSymbols, alphabet.symbols());
    if (symbols.size() > width)
      throw RangeError(std::format("Value {} does not fit into {} symbols", value, width));
    return std::string(width - symbols.size(), alphabet.zero()) + symbols;
  }

  inline uint64_t decodeField(std::string_view symbols, const Alphabet &alphabet) {
    mp::cpp_int value(convertBase(symbols, alphabet.symbols(), decimalSymbols).c_str());
    if (value > std::numeric_limits<uint64_t>::max())
      throw RangeError(std::format("Field '{}' exceeds 64 bits", symbols));
    return static_cast<uint64_t>(value);
  }
};  // namespace PrimeShare
#endif
