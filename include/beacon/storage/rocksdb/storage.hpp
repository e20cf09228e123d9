#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <beacon/common/critical.hpp>
#include <beacon/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace beacon::storage {

namespace detail {

inline beacon::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const beacon::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const beacon::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const write_batch& batch,
                       const beacon::schema::bytes_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const beacon::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const beacon::schema::bytes_view_t& prefix) const;
  void commit(const write_batch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const beacon::schema::bytes_view_t& key) const {
  if (!database) {
    beacon::common::critical("registry store is not open");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      beacon::common::critical("RocksDB read failed: {}", status.ToString());
    }
  }
  return {encoder.template decode<T>(beacon::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const write_batch& batch,
    const beacon::schema::bytes_t& key) const {
  if (auto staged = batch.find<T>(encoder, key)) {
    return staged;
  }
  return get<T>(encoder, beacon::schema::bytes_view_t{key.data(), key.size()});
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const beacon::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    beacon::common::critical("registry store is not open");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(beacon::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    beacon::common::critical("RocksDB write failed: {}", status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const beacon::schema::bytes_view_t& prefix) const {
  if (!database) {
    beacon::common::critical("registry store is not open");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    beacon::common::critical("RocksDB prefix scan failed: {}",
                             iterator->status().ToString());
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  if (!database) {
    beacon::common::critical("registry store is not open");
  }
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.entries) {
    auto put_status = rocks_batch.Put(
        detail::to_slice(beacon::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            beacon::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      beacon::common::critical("RocksDB batch staging failed: {}",
                               put_status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    beacon::common::critical("RocksDB batch commit failed: {}",
                             write_status.ToString());
  }
}

}  // namespace beacon::storage
