#pragma once

#include <stdexcept>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// ErrorCode: engine-wide failure taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every engine operation that can fail for a domain reason reports
//         one of these values in its result struct instead of throwing.
//
// @details
//   ValidationError    : malformed/out-of-range request; broker untouched.
//   NotFound           : unknown order_id.
//   InvalidState       : command illegal for the order's lifecycle state.
//   InvalidModification: modify violates the filled-quantity or price guard.
//   BrokerUnavailable  : no live broker session.
//   BrokerTimeout      : call dispatched, outcome unknown; re-query, do not
//                        resubmit.
//   UnknownOrder       : broker event that cannot be mapped to an order.
//   AlreadyBound       : attempt to rebind an order to a different broker id.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  None,
  ValidationError,
  NotFound,
  InvalidState,
  InvalidModification,
  BrokerUnavailable,
  BrokerTimeout,
  UnknownOrder,
  AlreadyBound,
};

const char* toString(ErrorCode code);

// -----------------------------------------------------------------------------
// BrokerError
// -----------------------------------------------------------------------------
// Thrown by IBrokerSession implementations when the transport fails (not
// connected, socket closed, request refused by the gateway). SessionGuard is
// the only component that catches it; everything above sees ErrorCode.
// -----------------------------------------------------------------------------
class BrokerError : public std::runtime_error {
 public:
  explicit BrokerError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by loadConfig() for unreadable or invalid configuration. Fatal at
// startup.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// StorageError
// -----------------------------------------------------------------------------
// Thrown by LedgerStore when the snapshot file cannot be read, parsed or
// written.
// -----------------------------------------------------------------------------
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace oms
