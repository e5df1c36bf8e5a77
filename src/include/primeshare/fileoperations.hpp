#ifndef PRIMESHARE_FILEOPERATIONS_HPP__
#define PRIMESHARE_FILEOPERATIONS_HPP__
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>

#include "primeshare/commandline.hpp"
using namespace PrimeShare;

namespace PrimeShare::FileOperations {
  namespace fs = std::filesystem;

  enum FileError { noErr, fileNotFoundErr, emptyFileErr, fileUnreadableErr, lengthMismatchErr, extraContentErr };

  static std::string shareFileName(const std::string &filename, uint64_t share) {
    return std::format("{}_{}.shr", filename, share);
  }

  // a share line without its line ending and any trailing whitespace editors leave behind
  static std::string trimShare(std::string line) {
    auto end = line.find_last_not_of(" \t\r\n");
    line.erase(end == std::string::npos ? 0 : end + 1);
    return line;
  }

  static const char *describe(FileError err) {
    switch (err) {
      case noErr:
        return "No error";
      case fileNotFoundErr:
        return "File(s) not found";
      case emptyFileErr:
        return "Share file holds no share";
      case fileUnreadableErr:
        return "File(s) not readable";
      case lengthMismatchErr:
        return "Shares have differing lengths";
      case extraContentErr:
        return "Share file holds more than one line";
    }
    return "Unknown error";
  }

  /*
   * A share file holds one share on its first line. Anything after that line other than
   * whitespace means the file was edited or concatenated by hand.
   */
  static FileError checkShareFile(const fs::path &filepath, std::uintmax_t &sharelen) {
    std::ifstream ifs(filepath);
    if (!ifs.good()) return fileUnreadableErr;

    std::string line;
    std::getline(ifs, line);
    auto share = trimShare(line);
    if (share.empty()) return emptyFileErr;

    while (std::getline(ifs, line))
      if (!trimShare(line).empty()) return extraContentErr;

    sharelen = share.size();
    return noErr;
  }

  // fsize is the input size for split and the common share length for join and info
  static FileError checkFiles(const CommandLine::CommandLineOptions &options, std::uintmax_t &fsize) {
    if (options.mode() == CommandLine::Mode::split) {
      auto filepath = fs::weakly_canonical(fs::absolute(options.filename()));
      if (!fs::exists(filepath)) return fileNotFoundErr;
      if (!std::ifstream(filepath).good()) return fileUnreadableErr;

      fsize = fs::file_size(filepath);
      return noErr;
    }

    std::uintmax_t sharelen = 0;

    for (auto i : options.shares()) {
      auto filepath = fs::weakly_canonical(fs::absolute(shareFileName(options.filename(), i)));
      if (!fs::exists(filepath)) return fileNotFoundErr;

      std::uintmax_t curlen = 0;
      if (auto err = checkShareFile(filepath, curlen); err != noErr) return err;

      if (!sharelen) sharelen = curlen;
      if (sharelen != curlen) return lengthMismatchErr;
    }

    fsize = sharelen;
    return noErr;
  }
};  // namespace PrimeShare::FileOperations
#endif
