#pragma once

#include <cstdint>
#include <string>

namespace ledger {

// Formats epoch milliseconds as UTC ISO-8601, e.g. "2024-03-01T09:15:00.250Z".
std::string ms_to_iso8601(std::int64_t ms);

}  // namespace ledger
