#include "oms/ledger/ledger_store.hpp"
#include "oms/codec/json_codec.hpp"
#include "oms/domain/error_code.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>

namespace oms {

namespace {

constexpr int kSnapshotVersion = 1;

}  // namespace

LedgerStore::LedgerStore(std::string path) : path_(std::move(path)) {}

bool LedgerStore::exists() const {
  std::ifstream in(path_);
  return in.good();
}

// -----------------------------------------------------------------------------
// load
// -----------------------------------------------------------------------------
LedgerSnapshot LedgerStore::load() const {
  std::ifstream in(path_);
  if (!in) {
    throw StorageError("cannot open ledger snapshot '" + path_ + "'");
  }

  LedgerSnapshot snapshot;
  try {
    nlohmann::json doc = nlohmann::json::parse(in);

    const int version = doc.value("version", 0);
    if (version != kSnapshotVersion) {
      throw StorageError("ledger snapshot '" + path_ +
                         "' has unsupported version " +
                         std::to_string(version));
    }

    snapshot.orders = doc.value("orders", nlohmann::json::array())
                          .get<std::vector<domain::Order>>();
    snapshot.fills = doc.value("fills", nlohmann::json::array())
                         .get<std::vector<domain::Fill>>();
    snapshot.positions = doc.value("positions", nlohmann::json::array())
                             .get<std::vector<domain::Position>>();
    snapshot.account_values =
        doc.value("account_values", nlohmann::json::array())
            .get<std::vector<domain::AccountValue>>();
    for (const auto& binding : doc.value("bindings", nlohmann::json::array())) {
      snapshot.bindings.emplace_back(
          binding.at("order_id").get<domain::OrderId>(),
          binding.at("broker_order_id").get<domain::BrokerOrderId>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw StorageError("malformed ledger snapshot '" + path_ +
                       "': " + e.what());
  } catch (const std::invalid_argument& e) {
    throw StorageError("malformed ledger snapshot '" + path_ +
                       "': " + e.what());
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// save: write-then-rename
// -----------------------------------------------------------------------------
void LedgerStore::save(const LedgerSnapshot& snapshot) const {
  nlohmann::json doc;
  doc["version"] = kSnapshotVersion;
  doc["orders"] = snapshot.orders;
  doc["fills"] = snapshot.fills;
  doc["positions"] = snapshot.positions;
  doc["account_values"] = snapshot.account_values;
  doc["bindings"] = nlohmann::json::array();
  for (const auto& [order_id, broker_order_id] : snapshot.bindings) {
    doc["bindings"].push_back(
        {{"order_id", order_id}, {"broker_order_id", broker_order_id}});
  }

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw StorageError("cannot write ledger snapshot '" + tmp + "'");
    }
    out << doc.dump(2) << "\n";
    if (!out) {
      throw StorageError("short write on ledger snapshot '" + tmp + "'");
    }
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    throw StorageError("cannot replace ledger snapshot '" + path_ + "'");
  }
  std::cout << "[LedgerStore] Saved " << snapshot.orders.size()
            << " orders to " << path_ << "\n";
}

}  // namespace oms
