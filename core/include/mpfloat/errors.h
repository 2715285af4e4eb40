#pragma once

#include <stdexcept>
#include <string>

namespace mpfloat {

struct FloatError : public std::runtime_error {
  explicit FloatError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

struct InvalidStringError : public FloatError {
  explicit InvalidStringError(std::string msg) : FloatError(std::move(msg)) {}
};

struct DivisionByZeroError : public FloatError {
  explicit DivisionByZeroError(std::string msg) : FloatError(std::move(msg)) {}
};

struct InvalidRootDegreeError : public FloatError {
  explicit InvalidRootDegreeError(std::string msg) : FloatError(std::move(msg)) {}
};

struct NegativeEvenRootError : public FloatError {
  explicit NegativeEvenRootError(std::string msg) : FloatError(std::move(msg)) {}
};

struct NaNResultError : public FloatError {
  explicit NaNResultError(std::string msg) : FloatError(std::move(msg)) {}
};

// Recoverable parse outcome for callers that do not want exceptions.
enum class ParseStatus {
  Ok,
  InvalidString,
};

}  // namespace mpfloat
