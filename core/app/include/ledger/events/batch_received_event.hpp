#pragma once

#include "ledger/domain/stock_batch.hpp"

#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// BatchReceivedEvent
// -----------------------------------------------------------------------------
// Published after a new batch and its BATCH_RECEIVED audit entry commit.
// Carries a full copy of the batch.
// -----------------------------------------------------------------------------
struct BatchReceivedEvent {
  domain::StockBatch batch;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace ledger
