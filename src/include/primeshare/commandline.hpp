#ifndef PRIMESHARE_COMMANDLINE_HPP__
#define PRIMESHARE_COMMANDLINE_HPP__
#include <unistd.h>

#include <cstdint>
#include <format>
#include <print>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

#include "primeshare/field.hpp"

namespace PrimeShare::CommandLine {
  enum class Mode { split, join, info };

  class CommandLineOptions {
   public:
    explicit CommandLineOptions() : mode_(Mode::split), m_(0), k_(0) {}
    explicit CommandLineOptions(int argc, char* const argv[]) : mode_(Mode::split), m_(0), k_(0) {
      parse(argc, argv);
    }

    void parse(int argc, char* const argv[]) {
      int c;
      opterr = 0;
      optind = 1;
      bool hasShares = false;
      bool modeSet = false;

      mode_ = Mode::split;
      m_ = k_ = 0;
      shares_.clear();
      filename_.clear();

      auto setMode = [&](Mode mode) {
        if (modeSet && mode_ != mode) throw std::invalid_argument("Options -j and -i are mutually exclusive");
        modeSet = true;
        mode_ = mode;
      };

      while ((c = getopt(argc, argv, "m:k:jis:")) != -1) {
        switch (c) {
          case 'm': {
            m_ = parseCount(optarg, "number of shares");
            break;
          }

          case 'k': {
            k_ = parseCount(optarg, "threshold");
            break;
          }

          case 'j': {
            setMode(Mode::join);
            break;
          }

          case 'i': {
            setMode(Mode::info);
            break;
          }

          case 's': {
            hasShares = true;
            uint64_t v;
            std::stringstream shareStr(optarg);

            while (shareStr >> v) {
              if (v == 0) throw std::invalid_argument("Share numbers start at 1");
              shares_.insert(v);
              if (shareStr.peek() == ',') shareStr.ignore();
            }
            if (!shareStr.eof()) throw std::invalid_argument(std::format("Invalid list of shares '{}'", optarg));
            break;
          }

          case '?': {
            auto err = std::format("Invalid option '{}'", static_cast<char>(optopt));
            throw std::invalid_argument(err);
            break;
          }
        }
      }

      if (mode_ == Mode::split) {
        if (m_ < 2 || m_ > maxShareCount)
          throw std::invalid_argument(std::format("Number of shares must be a number between 2 and {}", maxShareCount));
        if (k_ < 2 || k_ > m_)
          throw std::invalid_argument("Threshold must be a number between 2 and the number of shares");
        if (hasShares) throw std::invalid_argument("List of shares invalid for split mode");
      } else {
        if (!hasShares || shares_.empty())
          throw std::invalid_argument("List of shares must be supplied for join and info mode");
        if (mode_ == Mode::join && k_ && shares_.size() < k_)
          throw std::invalid_argument("Not enough shares specified");
      }

      int argdiff;

      if ((argdiff = (argc - optind)) == 1)
        filename_.assign(argv[optind]);
      else
        throw std::invalid_argument(argdiff == 0 ? "Missing filename argument"
                                                 : "Too many non-option arguments");
    }

    const auto m() const { return m_; }
    const auto k() const { return k_; }
    const auto& shares() const { return shares_; }
    const auto mode() const { return mode_; }
    const auto& filename() const { return filename_; }

    static void usage() {
      std::println("Usage (split): primeshare -m <shares> -k <threshold> <filename>");
      std::println("       (join): primeshare -j -s <\"s1 s2 ... \"> <filename>");
      std::println("       (info): primeshare -i -s <\"s1 s2 ... \"> <filename>");
      std::println("\ne.g.\nprimeshare -m 7 -k 4 plaintextfile \n -> plaintextfile_1.shr");
      std::println(" -> plaintextfile_2.shr\n -> ...\n -> plaintextfile_7.shr\n");
      std::println("primeshare -j -s \"2 4 5 7\" plaintextfile\n -> plaintextfile.out");
    }

   private:
    Mode mode_;
    uint64_t m_;
    uint64_t k_;
    std::set<uint64_t> shares_;
    std::string filename_;

    static uint64_t parseCount(const char* arg, const char* what) {
      std::size_t used = 0;
      uint64_t n;
      try {
        n = std::stoull(arg, &used);
      } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::format("The {} '{}' is too large", what, arg));
      } catch (const std::invalid_argument&) {
        throw std::invalid_argument(std::format("Invalid {} '{}'", what, arg));
      }
      if (arg[used] != '\0' || arg[0] == '-') throw std::invalid_argument(std::format("Invalid {} '{}'", what, arg));
      return n;
    }
  };
};  // namespace PrimeShare::CommandLine

#endif
