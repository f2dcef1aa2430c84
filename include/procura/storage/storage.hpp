#pragma once
#include <procura/schema/primitives.hpp>
#include <functional>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace procura::storage {

using key_value_entry_t =
    std::pair<procura::schema::bytes_t, procura::schema::bytes_t>;

/// Visitor for ordered scans. Return false to stop the scan.
using scan_visitor_t =
    std::function<bool(const procura::schema::bytes_view_t& key,
                       const procura::schema::bytes_view_t& value)>;

/// Writes staged for a single atomic commit.
///
/// Values are encoded at staging time, so a write set is independent of the
/// objects it was built from.
class write_set final {
 public:
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const procura::schema::bytes_t& key,
           const T& value) {
    puts_.push_back(key_value_entry_t{key, encoder.encode(value)});
  }

  void erase(const procura::schema::bytes_t& key) { erases_.push_back(key); }

  /// Append every write staged in `other`, preserving order.
  void merge(const write_set& other) {
    puts_.insert(std::end(puts_), std::begin(other.puts_),
                 std::end(other.puts_));
    erases_.insert(std::end(erases_), std::begin(other.erases_),
                   std::end(other.erases_));
  }

  bool empty() const { return puts_.empty() && erases_.empty(); }
  const std::vector<key_value_entry_t>& puts() const { return puts_; }
  const std::vector<procura::schema::bytes_t>& erases() const {
    return erases_;
  }

 private:
  std::vector<key_value_entry_t> puts_;
  std::vector<procura::schema::bytes_t> erases_;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const procura::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const procura::schema::bytes_view_t& key,
           const T& value) const;

  /// Apply every staged write or none of them. Erases apply before puts.
  void commit(const write_set& writes) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const procura::schema::bytes_view_t& prefix) const;

  /// Visit entries under `prefix` in key order, starting at the first key
  /// not less than `start`.
  void scan_from(const procura::schema::bytes_view_t& prefix,
                 const procura::schema::bytes_view_t& start,
                 const scan_visitor_t& visitor) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace procura::storage
