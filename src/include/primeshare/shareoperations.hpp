#ifndef PRIMESHARE_SHAREOPERATIONS_HPP__
#define PRIMESHARE_SHAREOPERATIONS_HPP__
#include <bit>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <print>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "primeshare/commandline.hpp"
#include "primeshare/fileoperations.hpp"
#include "primeshare/primeshare.hpp"
using namespace PrimeShare;

namespace PrimeShare::ShareOperations {
  namespace fs = std::filesystem;

  static std::string readShare(const std::string &sharename) {
    std::ifstream infile;

    infile.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    try {
      infile.open(sharename);
    } catch (const std::ifstream::failure &e) {
      std::println(stderr, "Can't open input file {}: {} ({}: {})", sharename, e.what(), e.code().value(),
                   e.code().message());
      throw;
    }

    std::string share;
    std::getline(infile, share);
    return FileOperations::trimShare(std::move(share));
  }

  static void splitFile(const fs::path &filepath, std::uintmax_t fsize, uint64_t m, uint64_t k) {
    std::shared_ptr<uint8_t[]> input;

    try {
      input = std::make_shared_for_overwrite<uint8_t[]>(fsize);
    } catch (const std::bad_alloc &e) {
      std::println(stderr, "Can't allocate input buffer: {}", e.what());
      throw;
    }

    {  // RAII
      std::ifstream infile;
      infile.exceptions(std::ifstream::failbit | std::ifstream::badbit);
      try {
        infile.open(filepath.c_str(), std::ios::in | std::ifstream::binary);
      } catch (const std::ifstream::failure &e) {
        std::println(stderr, "Can't open input file {}: {} ({}: {})", filepath.string(), e.what(),
                     e.code().value(), e.code().message());
        throw;
      }

      infile.read(std::bit_cast<char *>(input.get()), fsize);
    }

    std::vector<std::string> outputs;

    PrimeShare::Scheme scheme(m, k);

    scheme.split(input, fsize, outputs);

    auto ix{1u};
    for (auto &&o : outputs) {
      auto sharename = FileOperations::shareFileName(filepath.string(), ix++);
      std::ofstream share(sharename);
      share.exceptions(std::ofstream::failbit | std::ofstream::badbit);
      share << o << '\n';
    }
  }

  static void joinFile(const fs::path &filepath, const std::set<uint64_t> &shares) {
    std::vector<std::string> inputs;
    inputs.reserve(shares.size());

    for (auto share : shares) inputs.push_back(readShare(FileOperations::shareFileName(filepath.string(), share)));

    auto output = PrimeShare::Scheme::join(inputs);

    auto outputname = std::format("{}.out", filepath.string());

    std::ofstream outputfile(outputname, std::ofstream::binary);
    outputfile.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    outputfile.write(std::bit_cast<const char *>(output.data()), output.size());
  }

  static void describeShares(const fs::path &filepath, const std::set<uint64_t> &shares) {
    for (auto share : shares) {
      auto sharename = FileOperations::shareFileName(filepath.string(), share);
      auto record = PrimeShare::Scheme::describe(readShare(sharename));

      std::println("{}: byte width {}, prime {}, threshold {}, index {}, chunks {}, padding {}", sharename,
                   record.byteWidth, primeForByteWidth(record.byteWidth), record.threshold, record.index,
                   record.values.size(), record.padding);
    }
  }
};  // namespace PrimeShare::ShareOperations

#endif
