#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace procura::common {

/// Registry of mutexes created on demand per key.
///
/// Holders of different keys never contend beyond the short registry
/// critical section. Entries are reference counted and dropped once the last
/// holder releases them, so the registry only grows with concurrency, not
/// with the number of keys ever seen.
template <typename Key, typename Hash = std::hash<Key>>
class keyed_mutex final {
  struct entry final {
    std::mutex mutex;
    std::size_t users{};
  };

 public:
  class guard final {
   public:
    guard(keyed_mutex& owner, const Key& key) : owner_{owner}, key_{key} {
      {
        auto registry_lock = std::scoped_lock{owner_.registry_mutex_};
        auto& slot = owner_.entries_[key_];
        if (!slot) {
          slot = std::make_unique<entry>();
        }
        ++slot->users;
        entry_ = slot.get();
      }
      entry_->mutex.lock();
    }

    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    guard(guard&&) = delete;
    guard& operator=(guard&&) = delete;

    ~guard() {
      entry_->mutex.unlock();
      auto registry_lock = std::scoped_lock{owner_.registry_mutex_};
      if (--entry_->users == 0) {
        owner_.entries_.erase(key_);
      }
    }

   private:
    keyed_mutex& owner_;
    Key key_;
    entry* entry_{nullptr};
  };

  keyed_mutex() = default;
  keyed_mutex(const keyed_mutex&) = delete;
  keyed_mutex& operator=(const keyed_mutex&) = delete;

  /// Block until the mutex for `key` is held by the returned guard.
  guard lock(const Key& key) { return guard{*this, key}; }

  /// Number of keys currently held or awaited.
  std::size_t size() const {
    auto registry_lock = std::scoped_lock{registry_mutex_};
    return entries_.size();
  }

 private:
  mutable std::mutex registry_mutex_;
  std::unordered_map<Key, std::unique_ptr<entry>, Hash> entries_;
};

}  // namespace procura::common
