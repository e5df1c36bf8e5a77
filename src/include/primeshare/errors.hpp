#ifndef PRIMESHARE_ERRORS_HPP__
#define PRIMESHARE_ERRORS_HPP__
#include <stdexcept>
#include <string>

namespace PrimeShare {
  // invalid or unsupported share count, threshold or prime width
  class RangeError : public std::out_of_range {
   public:
    explicit RangeError(const std::string &what) : std::out_of_range(what) {}
  };

  class ConfigurationError : public std::logic_error {
   public:
    explicit ConfigurationError(const std::string &what) : std::logic_error(what) {}
  };

  // anything wrong with the shares handed to recover
  class ShareError : public std::invalid_argument {
   public:
    explicit ShareError(const std::string &what) : std::invalid_argument(what) {}
  };

  class MalformedShareError : public ShareError {
   public:
    explicit MalformedShareError(const std::string &what) : ShareError(what) {}
  };

  class IncompatibleSharesError : public ShareError {
   public:
    explicit IncompatibleSharesError(const std::string &what) : ShareError(what) {}
  };

  class InsufficientSharesError : public ShareError {
   public:
    explicit InsufficientSharesError(const std::string &what) : ShareError(what) {}
  };

  class DuplicateShareError : public ShareError {
   public:
    explicit DuplicateShareError(const std::string &what) : ShareError(what) {}
  };

  class EmptyInputError : public ShareError {
   public:
    explicit EmptyInputError(const std::string &what) : ShareError(what) {}
  };
};  // namespace PrimeShare
#endif
