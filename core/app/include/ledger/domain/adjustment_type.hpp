#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// AdjustmentType: reason code for a quantity correction
// -----------------------------------------------------------------------------
// Each reason implies a direction. Loss reasons always carry a negative
// delta, gain reasons a positive one, and the count/transfer corrections keep
// whatever sign the requester supplied. normalizeDelta() applies that rule so
// a "DAMAGE of 5" and a "DAMAGE of -5" land in the ledger identically.
// -----------------------------------------------------------------------------
enum class AdjustmentType {
  // Decreases
  Theft,
  Damage,
  Expired,
  Spoilage,
  Loss,
  Sample,
  WriteOff,
  SupplierReturn,
  TransferOut,
  // Increases
  CustomerReturn,
  Found,
  CorrectionIncrease,
  TransferIn,
  // Either direction
  Correction,
  Recount,
  Other,
};

enum class AdjustmentDirection { Decrease, Increase, Either };

inline AdjustmentDirection directionOf(AdjustmentType type) {
  using T = AdjustmentType;
  switch (type) {
    case T::Theft:
    case T::Damage:
    case T::Expired:
    case T::Spoilage:
    case T::Loss:
    case T::Sample:
    case T::WriteOff:
    case T::SupplierReturn:
    case T::TransferOut:
      return AdjustmentDirection::Decrease;
    case T::CustomerReturn:
    case T::Found:
    case T::CorrectionIncrease:
    case T::TransferIn:
      return AdjustmentDirection::Increase;
    case T::Correction:
    case T::Recount:
    case T::Other:
      return AdjustmentDirection::Either;
  }
  return AdjustmentDirection::Either;
}

// Shrinkage is the subset of decreases that represent genuine loss, as
// opposed to stock leaving on purpose (samples, supplier returns, transfers).
inline bool isShrinkage(AdjustmentType type) {
  using T = AdjustmentType;
  switch (type) {
    case T::Theft:
    case T::Damage:
    case T::Expired:
    case T::Spoilage:
    case T::Loss:
    case T::WriteOff:
      return true;
    default:
      return false;
  }
}

// Forces the sign of delta to agree with the type's direction. Callers bound
// |delta| by kMaxQuantity first.
inline std::int64_t normalizeDelta(AdjustmentType type, std::int64_t delta) {
  const std::int64_t magnitude = delta < 0 ? -delta : delta;
  switch (directionOf(type)) {
    case AdjustmentDirection::Decrease: return -magnitude;
    case AdjustmentDirection::Increase: return magnitude;
    case AdjustmentDirection::Either:   return delta;
  }
  return delta;
}

inline const char* adjustmentTypeToString(AdjustmentType type) {
  using T = AdjustmentType;
  switch (type) {
    case T::Theft:              return "THEFT";
    case T::Damage:             return "DAMAGE";
    case T::Expired:            return "EXPIRED";
    case T::Spoilage:           return "SPOILAGE";
    case T::Loss:               return "LOSS";
    case T::Sample:             return "SAMPLE";
    case T::WriteOff:           return "WRITE_OFF";
    case T::SupplierReturn:     return "SUPPLIER_RETURN";
    case T::TransferOut:        return "TRANSFER_OUT";
    case T::CustomerReturn:     return "CUSTOMER_RETURN";
    case T::Found:              return "FOUND";
    case T::CorrectionIncrease: return "CORRECTION_INCREASE";
    case T::TransferIn:         return "TRANSFER_IN";
    case T::Correction:         return "CORRECTION";
    case T::Recount:            return "RECOUNT";
    case T::Other:              return "OTHER";
  }
  return "UNKNOWN";
}

inline std::optional<AdjustmentType> parseAdjustmentType(
    std::string_view text) {
  using T = AdjustmentType;
  static constexpr T kAll[] = {
      T::Theft,          T::Damage,     T::Expired,
      T::Spoilage,       T::Loss,       T::Sample,
      T::WriteOff,       T::SupplierReturn, T::TransferOut,
      T::CustomerReturn, T::Found,      T::CorrectionIncrease,
      T::TransferIn,     T::Correction, T::Recount,
      T::Other,
  };
  for (T candidate : kAll) {
    if (text == adjustmentTypeToString(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace ledger
