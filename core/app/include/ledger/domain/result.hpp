#pragma once

#include "ledger/domain/ledger_error.hpp"

#include <utility>
#include <variant>

namespace ledger {

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
//
// @brief  Either the value an operation produced or the LedgerError that
//         explains why it did not commit.
//
// @details
// A thin wrapper over std::variant<T, LedgerError>. Using the variant keeps
// both outcomes as plain values (no exceptions cross the engine boundary,
// no heap allocation) while the named accessors read better at call sites
// than std::get / std::holds_alternative.
//
// Accessing value() on an error (or error() on a value) throws
// std::bad_variant_access; callers are expected to test ok() first.
//
// Thread model:
//   Value type. Safe to move across threads.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : data_(std::move(value)) {}           // NOLINT implicit
  Result(LedgerError error) : data_(std::move(error)) {}  // NOLINT implicit

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<T>(data_); }
  T& value() & { return std::get<T>(data_); }
  T&& value() && { return std::get<T>(std::move(data_)); }

  const LedgerError& error() const { return std::get<LedgerError>(data_); }

 private:
  std::variant<T, LedgerError> data_;
};

}  // namespace ledger
