#ifndef ASEMETA_ASE_EXCEPTION_H
#define ASEMETA_ASE_EXCEPTION_H

#include <stdexcept>
#include <string>

// Raised when results violate a processing invariant (e.g. ranking input
// that is not sorted on significance).
class AseException : public std::runtime_error {
 public:
  explicit AseException(const std::string& what) : std::runtime_error(what) { }
};

#endif
