#pragma once
#include <beacon/schema/primitives.hpp>
#include <string_view>

namespace beacon::schema {

/// Derive the fixed-size symbol id for a ticker (BLAKE3 of its bytes).
symbol_id_t make_symbol_id(const std::string_view& ticker);

}  // namespace beacon::schema
