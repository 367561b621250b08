#pragma once

#include <cstdint>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Row identifiers
// -----------------------------------------------------------------------------
// Responsibility: Name the primary keys of the four ledger tables.
//
// All four are unsigned 64-bit values handed out by an IdGenerator owned by
// LedgerEngine. Zero is never issued and reads as "unset". The aliases keep
// signatures self-documenting (BatchId vs AllocationId) while staying cheap to
// copy, compare and hash.
//
// External identities (product, warehouse, storefront, supplier, user) are
// owned by collaborators outside the ledger and are carried as opaque strings.
// -----------------------------------------------------------------------------
using BatchId = std::uint64_t;
using AdjustmentId = std::uint64_t;
using AllocationId = std::uint64_t;
using AuditEntryId = std::uint64_t;

// Quantities are whole units. Signed so that what-if sums may dip below zero
// before validation rejects them.
using Quantity = std::int64_t;

// Largest magnitude accepted for a recorded quantity, an adjustment delta or
// an allocation. Sums of many such values stay far inside int64_t.
constexpr Quantity kMaxQuantity = 1'000'000'000'000;

// Money is held in minor currency units (e.g. cents).
using MinorUnits = std::int64_t;

}  // namespace domain
}  // namespace ledger
