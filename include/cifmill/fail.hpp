// Copyright 2026 Global Phasing Ltd.
//
// Exceptions thrown when a CIF block cannot be turned into a crystal model.

#ifndef CIFMILL_FAIL_HPP_
#define CIFMILL_FAIL_HPP_

#include <stdexcept>  // for runtime_error
#include <string>
#include <utility>    // for forward
#include <gemmi/util.hpp>  // for cat

#if defined(_WIN32) && defined(CIFMILL_SHARED)
# if defined(CIFMILL_BUILD)
#  define CIFMILL_DLL __declspec(dllexport)
# else
#  define CIFMILL_DLL __declspec(dllimport)
# endif
#elif defined(__GNUC__) && defined(CIFMILL_SHARED)
# define CIFMILL_DLL __attribute__((visibility("default")))
#else
# define CIFMILL_DLL
#endif

namespace cifmill {

enum class ErrorKind { Parse, MissingData, IncompleteData, InvalidValue };

/// Base class of all errors. The message names the offending tag
/// and, where there is one, the literal value.
class CifBuildError : public std::runtime_error {
public:
  CifBuildError(ErrorKind kind, const std::string& msg)
    : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }
private:
  ErrorKind kind_;
};

// malformed symmetry operator or numeric literal
struct ParseError : CifBuildError {
  explicit ParseError(const std::string& msg)
    : CifBuildError(ErrorKind::Parse, msg) {}
};

// required tag or column absent
struct MissingDataError : CifBuildError {
  explicit MissingDataError(const std::string& msg)
    : CifBuildError(ErrorKind::MissingData, msg) {}
};
struct MissingSymmetryError : MissingDataError {
  using MissingDataError::MissingDataError;
};
struct MissingIndicesError : MissingDataError {
  using MissingDataError::MissingDataError;
};
struct NoCoordinatesError : MissingDataError {
  using MissingDataError::MissingDataError;
};
struct NoReflectionDataError : MissingDataError {
  using MissingDataError::MissingDataError;
};

// multi-column entity given only partially
struct IncompleteDataError : CifBuildError {
  explicit IncompleteDataError(const std::string& msg)
    : CifBuildError(ErrorKind::IncompleteData, msg) {}
};
struct IncompleteCellError : IncompleteDataError {
  using IncompleteDataError::IncompleteDataError;
};
struct IncompleteADPError : IncompleteDataError {
  using IncompleteDataError::IncompleteDataError;
};

// value present but wrong
struct InvalidValueError : CifBuildError {
  explicit InvalidValueError(const std::string& msg)
    : CifBuildError(ErrorKind::InvalidValue, msg) {}
};
struct InvalidIdentifierError : InvalidValueError {
  using InvalidValueError::InvalidValueError;
};
struct InvalidIndexError : InvalidValueError {
  using InvalidValueError::InvalidValueError;
};
struct InvalidCellError : InvalidValueError {
  using InvalidValueError::InvalidValueError;
};
struct MalformedCellParameterError : InvalidValueError {
  using InvalidValueError::InvalidValueError;
};
struct IncompatibleSymmetryError : InvalidValueError {
  using InvalidValueError::InvalidValueError;
};

/// Usage: fail<InvalidCellError>("Invalid unit cell: ", a, ' ', b);
template<typename E, class... Args> [[noreturn]]
void fail(Args const&... args) { throw E(gemmi::cat(args...)); }

} // namespace cifmill
#endif
