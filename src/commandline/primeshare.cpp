#include "primeshare/primeshare.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <ios>
#include <print>
#include <stdexcept>

#include "primeshare/commandline.hpp"
#include "primeshare/fileoperations.hpp"
#include "primeshare/shareoperations.hpp"
using namespace PrimeShare;

int main(int argc, char *argv[]) {
  CommandLine::CommandLineOptions options;

  try {
    options.parse(argc, argv);
  } catch (std::invalid_argument &e) {
    std::println(stderr, "Error: {}", e.what());
    CommandLine::CommandLineOptions::usage();
    exit(-EINVAL);
  }

  std::uintmax_t fsize = 0;
  FileOperations::FileError fileErr;

  if ((fileErr = FileOperations::checkFiles(options, fsize)) != FileOperations::noErr) {
    std::println(stderr, "!!! Error: {}\n", FileOperations::describe(fileErr));
    CommandLine::CommandLineOptions::usage();
    exit(fileErr == FileOperations::fileNotFoundErr ? -ENOENT : -EINVAL);
  }

  try {
    switch (options.mode()) {
      case CommandLine::Mode::split: {
        ShareOperations::splitFile(options.filename(), fsize, options.m(), options.k());
        break;
      }

      case CommandLine::Mode::join: {
        ShareOperations::joinFile(options.filename(), options.shares());
        break;
      }

      case CommandLine::Mode::info: {
        ShareOperations::describeShares(options.filename(), options.shares());
        break;
      }
    }
  } catch (const ShareError &e) {
    std::println(stderr, "!!! Error: {}", e.what());
    exit(-EINVAL);
  } catch (const RangeError &e) {
    std::println(stderr, "!!! Error: {}", e.what());
    exit(-ERANGE);
  } catch (const std::ios_base::failure &e) {
    std::println(stderr, "!!! I/O error: {}", e.what());
    exit(-EIO);
  }

  return 0;
}
