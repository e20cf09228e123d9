#pragma once

#include <beacon/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace beacon::testing {

inline beacon::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = beacon::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Account ids only differ in the first byte, which keeps them readable in
/// failure output.
inline beacon::schema::account_id_t make_account(const uint8_t seed) {
  auto account = beacon::schema::account_id_t{};
  account[0] = seed;
  return account;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace beacon::testing
