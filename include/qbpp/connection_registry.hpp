// Copyright (c) 2024 liudegui. MIT License.
//
// qbpp::ConnectionRegistry -- one wrapper per native connection handle.
//
// Design:
//   - Keyed by handle identity; holds only a weak_ptr to the handle, so the
//     pool alone decides how long a handle lives
//   - Entries whose handle has expired are pruned on every insert, and an
//     expired entry never matches a new handle at a reused address
//   - Wrappers are owned by the registry and stay at a fixed address
//   - Thread-safe

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace qbpp {

template <typename Handle, typename Wrapper>
class ConnectionRegistry {
 public:
  using WrapperFactory = std::function<std::unique_ptr<Wrapper>()>;

  ConnectionRegistry() = default;

  // Non-copyable, non-movable
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /// The wrapper registered for `handle`, or nullptr.
  Wrapper* Find(const std::shared_ptr<Handle>& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = FindLocked(handle);
    return (entry != nullptr) ? entry->wrapper.get() : nullptr;
  }

  /// Look up the wrapper for `handle`; create it with `make` when absent.
  /// `*created` tells which happened.
  Wrapper* FindOrCreate(const std::shared_ptr<Handle>& handle,
                        const WrapperFactory& make, bool* created) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (created != nullptr) { *created = false; }
    if (handle == nullptr) { return nullptr; }

    Entry* entry = FindLocked(handle);
    if (entry != nullptr) { return entry->wrapper.get(); }

    PruneLocked();
    std::unique_ptr<Wrapper> wrapper = make();
    if (wrapper == nullptr) { return nullptr; }
    Wrapper* raw = wrapper.get();
    entries_[handle.get()] = Entry{handle, std::move(wrapper)};
    if (created != nullptr) { *created = true; }
    return raw;
  }

  /// True if `wrapper` was created by this registry and is still held.
  /// `Base` is any base class of Wrapper.
  template <typename Base>
  bool Contains(const Base* wrapper) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : entries_) {
      const Base* held = kv.second.wrapper.get();
      if (held == wrapper) { return true; }
    }
    return false;
  }

  /// Number of entries, expired ones included until the next prune.
  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  void Prune() {
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

 private:
  struct Entry {
    std::weak_ptr<Handle> handle;
    std::unique_ptr<Wrapper> wrapper;
  };

  Entry* FindLocked(const std::shared_ptr<Handle>& handle) {
    if (handle == nullptr) { return nullptr; }
    auto it = entries_.find(handle.get());
    if (it == entries_.end()) { return nullptr; }
    std::shared_ptr<Handle> live = it->second.handle.lock();
    if (live != handle) {
      // Address reused by a new handle after the old one died.
      entries_.erase(it);
      return nullptr;
    }
    return &it->second;
  }

  void PruneLocked() {
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.handle.expired()) {
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }

  mutable std::mutex mutex_;
  std::map<const Handle*, Entry> entries_;
};

}  // namespace qbpp
