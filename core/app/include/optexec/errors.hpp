#pragma once

#include <stdexcept>
#include <string>

namespace optexec {

// -----------------------------------------------------------------------------
// Engine error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types raised by engine components.
//
// @details
// Only InvalidConfiguration is allowed to abort the process, and only at
// startup (loadEngineConfig / TradingEngine construction). Everything else
// is caught at the component boundary that can decide what "safe" means:
//
//   InvalidConfiguration  Unknown sizing mode, malformed config file. Fatal.
//   InvalidState          Registering a position without a positive entry
//                         price. Fatal for that position only.
//   PriceUnavailable      No usable LTP after the bounded retry window.
//                         The current signal is dropped.
//   BrokerRejected        The broker refused an order. The order becomes
//                         REJECTED and no position is opened.
//   PersistenceFailure    A journal write failed. Logged; in-memory state
//                         stays authoritative for the session.
//
// A late cancel of an already executed order is not an exception:
// IBroker::cancelOrder() simply returns false.
// -----------------------------------------------------------------------------

class InvalidConfiguration : public std::runtime_error {
 public:
  explicit InvalidConfiguration(const std::string& what)
      : std::runtime_error(what) {}
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& what) : std::runtime_error(what) {}
};

class PriceUnavailable : public std::runtime_error {
 public:
  explicit PriceUnavailable(const std::string& what)
      : std::runtime_error(what) {}
};

class BrokerRejected : public std::runtime_error {
 public:
  explicit BrokerRejected(const std::string& what)
      : std::runtime_error(what) {}
};

class PersistenceFailure : public std::runtime_error {
 public:
  explicit PersistenceFailure(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace optexec
