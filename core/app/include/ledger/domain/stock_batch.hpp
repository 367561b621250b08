#pragma once

#include "ledger/domain/ids.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// CostFields: receiving cost carried on a batch
// -----------------------------------------------------------------------------
// The ledger never reads these for availability. They are copied onto new
// adjustments so the financial impact of a loss is priced at the cost the
// batch was received at.
// -----------------------------------------------------------------------------
struct CostFields {
  MinorUnits unit_cost{0};         // Supplier price per unit
  MinorUnits landed_unit_cost{0};  // Unit cost including freight and duties
};

// -----------------------------------------------------------------------------
// StockBatch: one warehouse receipt of a product
// -----------------------------------------------------------------------------
//
// @brief  Immutable record of how many units arrived in a single receipt.
//
// @details
// recorded_quantity is written once when the batch is received and is the
// single source of truth for the receipt. Losses and gains are never folded
// into it; they live in the AdjustmentLedger and are summed on demand. The
// BatchStore exposes no update operation, so there is no code
// path that could rewrite recorded_quantity after insertion.
//
// Thread model:
//   Value type. The authoritative copy lives in BatchStore; every reader
//   gets a copy.
// -----------------------------------------------------------------------------
struct StockBatch {
  BatchId id{0};
  std::string product_id;
  std::string warehouse_id;
  std::optional<std::string> supplier_id;
  Quantity recorded_quantity{0};
  CostFields cost;
  std::optional<std::string> reference;  // Receiving note / delivery number
  std::string received_by;
  std::int64_t received_at_ms{0};
};

}  // namespace domain
}  // namespace ledger
