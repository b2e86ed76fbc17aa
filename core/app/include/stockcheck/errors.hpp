#pragma once

#include <stdexcept>
#include <string>

namespace stockcheck {

// -----------------------------------------------------------------------------
// Exceptions raised at the program's outer boundary
// -----------------------------------------------------------------------------
//
// The reconciliation core never throws. These types are reserved for the
// collaborators around it: input files that cannot be opened and
// configuration that cannot be honoured. Individual malformed rows or
// lines are skipped by the readers, not reported through exceptions.
// -----------------------------------------------------------------------------

// An inventory export or want-list could not be read.
class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

// The configuration file or command line holds an unusable value.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace stockcheck
