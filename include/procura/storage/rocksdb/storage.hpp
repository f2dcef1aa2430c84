#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <procura/common/critical.hpp>
#include <procura/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace procura::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const procura::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline procura::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return procura::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const procura::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const procura::schema::bytes_view_t& key,
           const T& value) const;

  void commit(const write_set& writes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const procura::schema::bytes_view_t& prefix) const;
  void scan_from(const procura::schema::bytes_view_t& prefix,
                 const procura::schema::bytes_view_t& start,
                 const scan_visitor_t& visitor) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const procura::schema::bytes_view_t& key) const {
  if (!database) {
    procura::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    procura::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(procura::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const procura::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    procura::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(procura::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    procura::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_set& writes) const {
  if (!database) {
    procura::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.erases()) {
    auto delete_status = batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      procura::common::critical("failed staging delete in write batch");
    }
  }
  for (const auto& [key, value] : writes.puts()) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      procura::common::critical("failed staging put in write batch");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    procura::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const procura::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  scan_from(prefix, prefix,
            [&](const procura::schema::bytes_view_t& key,
                const procura::schema::bytes_view_t& value) {
              entries.push_back(key_value_entry_t{
                  procura::schema::make_bytes(key),
                  procura::schema::make_bytes(value)});
              return true;
            });
  return entries;
}

inline void storage<rocksdb_storage_tag>::scan_from(
    const procura::schema::bytes_view_t& prefix,
    const procura::schema::bytes_view_t& start,
    const scan_visitor_t& visitor) const {
  if (!database) {
    procura::common::critical("RocksDB database is not initialized");
  }

  auto prefix_view = procura::schema::make_string_view(prefix);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(start));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    if (!visitor(detail::to_bytes_view(iterator->key()),
                 detail::to_bytes_view(iterator->value()))) {
      return;
    }
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iterator failed: {}",
                  iterator->status().ToString());
    procura::common::critical("RocksDB iterator failed");
  }
}

}  // namespace procura::storage
