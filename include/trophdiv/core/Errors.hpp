#pragma once

#include <stdexcept>
#include <string>

namespace trophdiv {

// Structural input checks performed once, before any per-community work.
enum class ErrorKind {
  DimensionMismatch, // species count differs between abundances and trophic levels
  InvalidInput,      // missing trophic level
  NameMismatch,      // species identifiers differ in content or order
};

inline const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::DimensionMismatch: return "DimensionMismatch";
    case ErrorKind::InvalidInput: return "InvalidInput";
    case ErrorKind::NameMismatch: return "NameMismatch";
  }
  return "InvalidInput";
}

class InputError : public std::runtime_error {
public:
  InputError(ErrorKind kind, const std::string& msg)
      : std::runtime_error(std::string(error_kind_name(kind)) + ": " + msg), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace trophdiv
