#pragma once

#include "ledger/domain/ids.hpp"

#include <cstdint>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Allocation: units of a batch committed to one storefront
// -----------------------------------------------------------------------------
// For every batch the sum of its allocation quantities must never exceed the
// batch's available quantity. Every create or update is validated against
// that floor inside the batch's unit of work; a release only lowers the sum
// and is always permitted.
// -----------------------------------------------------------------------------
struct Allocation {
  AllocationId id{0};
  BatchId stock_batch_id{0};
  std::string storefront_id;
  Quantity quantity{0};
  std::string allocated_by;
  std::int64_t updated_at_ms{0};
};

}  // namespace domain
}  // namespace ledger
