#pragma once

#include "ledger/events/adjustment_update_event.hpp"
#include "ledger/events/allocation_update_event.hpp"
#include "ledger/events/audit_recorded_event.hpp"
#include "ledger/events/batch_received_event.hpp"

#include <variant>

namespace ledger {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope for every change notification the ledger emits. One
// EventBus carries all kinds; subscribers pick theirs with the typed
// subscribe<T>() or std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    BatchReceivedEvent,
    AdjustmentUpdateEvent,
    AllocationUpdateEvent,
    AuditRecordedEvent>;

}  // namespace ledger
