#pragma once
#include <blake3.h>
#include <beacon/schema/primitives.hpp>
#include <string_view>

namespace beacon::blake3 {

/// Incremental BLAKE3 state. Finalizing does not consume the state, so more
/// input may follow.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const beacon::schema::bytes_view_t& bytes);

  beacon::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

beacon::schema::hash32_t hash(const std::string_view& str);
beacon::schema::hash32_t hash(const beacon::schema::bytes_view_t& bytes);

}  // namespace beacon::blake3
