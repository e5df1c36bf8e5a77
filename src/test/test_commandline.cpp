#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <print>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "primeshare/commandline.hpp"
#include "primeshare/fileoperations.hpp"
#include "primeshare/shareoperations.hpp"
#include "testsupport.hpp"

using namespace PrimeShare;
using PrimeShare::Test::throws;
namespace fs = std::filesystem;

namespace {

CommandLine::CommandLineOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "primeshare");
  std::vector<char *> argv;
  for (auto &arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  return CommandLine::CommandLineOptions(static_cast<int>(args.size()), argv.data());
}

void testSplitOptions() {
  auto options = parse({"-m", "7", "-k", "4", "secret.txt"});
  assert(options.mode() == CommandLine::Mode::split);
  assert(options.m() == 7);
  assert(options.k() == 4);
  assert(options.filename() == "secret.txt");

  assert(parse({"-m", "300", "-k", "2", "f"}).m() == 300);

  assert(throws<std::invalid_argument>([] { parse({"-m", "7", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "7", "-k", "8", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "1", "-k", "1", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "seven", "-k", "2", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "99999999999999999999999", "-k", "2", "f"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "7", "-k", "4", "-s", "1", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "7", "-k", "4"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-m", "7", "-k", "4", "a", "b"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-x", "secret.txt"}); }));
}

void testJoinOptions() {
  auto options = parse({"-j", "-s", "2 4,5 7", "secret.txt"});
  assert(options.mode() == CommandLine::Mode::join);
  assert((options.shares() == std::set<uint64_t>{2, 4, 5, 7}));

  assert(parse({"-i", "-s", "1", "secret.txt"}).mode() == CommandLine::Mode::info);

  assert(throws<std::invalid_argument>([] { parse({"-j", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-j", "-s", "0 1", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-j", "-s", "1 two", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-j", "-k", "3", "-s", "1 2", "secret.txt"}); }));
  assert(throws<std::invalid_argument>([] { parse({"-j", "-i", "-s", "1 2", "secret.txt"}); }));
}

void testFiles() {
  auto dir = fs::temp_directory_path() / "primeshare_test_commandline";
  fs::remove_all(dir);
  fs::create_directories(dir);
  auto secretfile = (dir / "secret.bin").string();

  std::string secret("line one\nline two\0 with a nul", 29);
  {
    std::ofstream out(secretfile, std::ofstream::binary);
    out.write(secret.data(), secret.size());
  }

  std::uintmax_t fsize = 0;
  auto splitOptions = parse({"-m", "5", "-k", "3", secretfile});
  assert(FileOperations::checkFiles(splitOptions, fsize) == FileOperations::noErr);
  assert(fsize == secret.size());

  ShareOperations::splitFile(secretfile, fsize, splitOptions.m(), splitOptions.k());
  for (uint64_t i = 1; i <= 5; i++) assert(fs::exists(FileOperations::shareFileName(secretfile, i)));

  auto joinOptions = parse({"-j", "-s", "5 1 3", secretfile});
  assert(FileOperations::checkFiles(joinOptions, fsize) == FileOperations::noErr);
  // header of five symbols, then two symbols per byte
  assert(fsize == 5 + 2 * secret.size());
  ShareOperations::joinFile(secretfile, joinOptions.shares());

  {
    std::ifstream in(secretfile + ".out", std::ifstream::binary);
    std::string joined((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(joined == secret);
  }

  ShareOperations::describeShares(secretfile, joinOptions.shares());

  assert(throws<InsufficientSharesError>([&] { ShareOperations::joinFile(secretfile, {1, 2}); }));

  auto missing = parse({"-j", "-s", "1 9", secretfile});
  assert(FileOperations::checkFiles(missing, fsize) == FileOperations::fileNotFoundErr);

  const auto second = FileOperations::shareFileName(secretfile, 2);
  std::string share;
  {
    std::ifstream in(second);
    std::getline(in, share);
  }
  auto trio = parse({"-j", "-s", "1 2 5", secretfile});

  auto rewrite = [&](const std::string &content) {
    std::ofstream out(second, std::ofstream::binary);
    out << content;
  };

  // line endings and trailing blanks are not part of the share
  rewrite(share + " \r\n\n");
  assert(FileOperations::checkFiles(trio, fsize) == FileOperations::noErr);
  assert(fsize == share.size());
  ShareOperations::joinFile(secretfile, trio.shares());
  {
    std::ifstream in(secretfile + ".out", std::ifstream::binary);
    std::string joined((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(joined == secret);
  }

  rewrite("");
  assert(FileOperations::checkFiles(trio, fsize) == FileOperations::emptyFileErr);
  rewrite("\n  \n");
  assert(FileOperations::checkFiles(trio, fsize) == FileOperations::emptyFileErr);

  rewrite(share + "\n" + share + "\n");
  assert(FileOperations::checkFiles(trio, fsize) == FileOperations::extraContentErr);

  rewrite("10302\n");
  assert(FileOperations::checkFiles(trio, fsize) == FileOperations::lengthMismatchErr);

  fs::remove_all(dir);
}

}  // namespace

int main() {
  testSplitOptions();
  testJoinOptions();
  testFiles();

  std::println("commandline: ok");
  return 0;
}
