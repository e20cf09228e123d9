#pragma once
#include <beacon/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace beacon::storage {

using key_value_entry_t =
    std::pair<beacon::schema::bytes_t, beacon::schema::bytes_t>;

/// Staged puts for one registry operation, committed atomically by
/// `storage::commit`. Later puts to the same key replace earlier ones, and
/// reads made while staging can see the staged value through `find`.
struct write_batch final {
  std::map<beacon::schema::bytes_t, beacon::schema::bytes_t> entries;

  template <typename Encoder, typename T>
  void put(Encoder& encoder, const beacon::schema::bytes_t& key, const T& value) {
    entries.insert_or_assign(key, encoder.encode(value));
  }

  template <typename T, typename Encoder>
  std::optional<T> find(Encoder& encoder,
                        const beacon::schema::bytes_t& key) const {
    auto it = entries.find(key);
    if (it == std::end(entries)) {
      return std::nullopt;
    }
    return encoder.template decode<T>(beacon::schema::bytes_view_t{
        it->second.data(), it->second.size()});
  }

  bool empty() const { return entries.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const beacon::schema::bytes_view_t& key) const;

  /// Same as `get`, but a value staged in `batch` wins over the stored one.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const write_batch& batch,
                       const beacon::schema::bytes_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const beacon::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const beacon::schema::bytes_view_t& prefix) const;

  /// Atomically persist every entry of the batch.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace beacon::storage
