#pragma once

#include <stdexcept>
#include <string>

namespace breakout {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// Exceptions are reserved for seams where the caller must decide what to do:
//
//   ResolutionError : no valid expiry / strike set for an index. Fatal to
//                     strategy creation; the strategy is never added.
//   NotFoundError   : a catalog lookup for a contract that is not listed.
//                     The resolver catches it and skips that strike.
//   ConfigError     : malformed settings file or bootstrap strategy. Fatal
//                     at startup.
//
// Hot-path conditions (tick dropped on overflow, clock skew, subscriber
// failure) are never thrown: they are counted, logged and published as
// diagnostics. Removal of an unknown strategy is a `false` return on the
// control surface, not an exception.
// -----------------------------------------------------------------------------
class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& what)
      : std::runtime_error(what) {}
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& what)
      : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace breakout
