#pragma once

#include <cstddef>
#include <cstdint>

namespace beacon::schema {

/// Basis-point denominator used for fee and rate arithmetic.
inline constexpr uint32_t kFeeDenominator = 10000;
/// Hard cap on the number of intents a registry will ever hold.
inline constexpr uint64_t kMaxIntents = 10000;
/// Largest id list accepted by the bulk fetch accessors.
inline constexpr std::size_t kMaxBulkQuery = 200;

}  // namespace beacon::schema
