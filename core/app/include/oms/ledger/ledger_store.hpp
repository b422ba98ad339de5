#pragma once

#include "oms/ledger/order_ledger.hpp"

#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// LedgerStore: JSON snapshot file for the ledger and the id bindings
// -----------------------------------------------------------------------------
//
// @brief  Loads the ledger at engine start and writes it back at stop, so
//         order history and the id counter survive a restart.
//
// @details
// File layout:
//   {
//     "version": 1,
//     "orders": [...], "fills": [...], "positions": [...],
//     "account_values": [...],
//     "bindings": [{"order_id": 1, "broker_order_id": 555}, ...]
//   }
//
// save() writes to "<path>.tmp" and renames over the target, so a crash
// mid-write leaves the previous snapshot intact.
//
// Errors: load() and save() throw StorageError with the path and cause.
// -----------------------------------------------------------------------------
class LedgerStore {
 public:
  explicit LedgerStore(std::string path);

  const std::string& path() const { return path_; }
  bool exists() const;

  LedgerSnapshot load() const;
  void save(const LedgerSnapshot& snapshot) const;

 private:
  std::string path_;
};

}  // namespace oms
