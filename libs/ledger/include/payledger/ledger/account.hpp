#pragma once

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

struct Account {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  bool locked{false};
};

// Export-only view; total is derived when the snapshot is taken.
struct AccountSnapshot {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

[[nodiscard]] inline AccountSnapshot make_snapshot(const Account& account) noexcept {
  return AccountSnapshot{
      .client = account.client,
      .available = account.available,
      .held = account.held,
      .total = account.available + account.held,
      .locked = account.locked,
  };
}

}  // namespace ledger
}  // namespace payledger
