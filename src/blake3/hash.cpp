#include <beacon/blake3/hash.hpp>

namespace beacon::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const beacon::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

beacon::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == sizeof(beacon::schema::hash32_t));
  auto digest = beacon::schema::hash32_t{};
  blake3_hasher_finalize(&state_, digest.data(), digest.size());
  return digest;
}

beacon::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

beacon::schema::hash32_t hash(const beacon::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace beacon::blake3
