#include <memory>
#include <print>
#include <string>
#include <vector>

#include "primeshare/primeshare.hpp"

int main() {
  constexpr std::size_t M = 5;
  constexpr std::size_t K = 3;

  // initialise a Scheme object to split memory buffers into M shares, any K of which recover it
  PrimeShare::Scheme s(M, K);

  // create an input buffer and fill it with A-Z

  const std::size_t len = 26;
  auto inbuffer = std::make_shared<uint8_t[]>(len);
  for (auto i{0u}; i < len; i++) {
    inbuffer[i] = i + 'A';
  }
  std::println("INPUT: {}", std::string(inbuffer.get(), inbuffer.get() + len));

  // split the input buffer into printable share strings
  std::vector<std::string> shares;
  s.split(inbuffer, len, shares);

  std::println("OUTPUT");
  for (auto &share : shares) std::println("{}", share);

  // the share headers carry everything needed to join them again, in any order
  std::vector<std::string> subset{shares[3], shares[0], shares[2]};
  auto joined = s.recover(subset);

  std::println("JOINED: {}\n", std::string(joined.begin(), joined.end()));

  auto record = PrimeShare::Scheme::describe(shares[0]);
  std::println("byte width {}, prime {}, threshold {}, index {}", record.byteWidth, s.field()->prime(),
               record.threshold, record.index);

  // providing fewer than K shares is refused
  subset.pop_back();
  try {
    s.recover(subset);
  } catch (const PrimeShare::InsufficientSharesError &e) {
    std::println("Refused: {}", e.what());
  }

  return 0;
}
