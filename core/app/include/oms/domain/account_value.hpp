#pragma once

#include <functional>
#include <string>
#include <tuple>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// AccountValue: one broker-reported account metric
// -----------------------------------------------------------------------------
// Keyed by (account, tag, currency). value is passed through exactly as the
// broker reported it; tags carry different formats (numbers, booleans,
// free text) so the engine never coerces it.
// -----------------------------------------------------------------------------
struct AccountValueKey {
  std::string account;
  std::string tag;
  std::string currency;

  bool operator==(const AccountValueKey& other) const {
    return std::tie(account, tag, currency) ==
           std::tie(other.account, other.tag, other.currency);
  }
};

struct AccountValueKeyHash {
  std::size_t operator()(const AccountValueKey& k) const {
    std::size_t h = std::hash<std::string>{}(k.account);
    h ^= std::hash<std::string>{}(k.tag) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(k.currency) + 0x9e3779b9 + (h << 6) +
         (h >> 2);
    return h;
  }
};

struct AccountValue {
  std::string account;
  std::string tag;
  std::string currency;
  std::string value;

  AccountValueKey key() const { return {account, tag, currency}; }
};

}  // namespace domain
}  // namespace oms
