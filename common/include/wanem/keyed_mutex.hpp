/* A set of mutexes, one per key.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

namespace wanem {

template <typename Key> class KeyedMutex {

protected:
  // Guards the map, not the per-key mutexes.
  std::mutex mutex;

  std::map<Key, std::unique_ptr<std::mutex>> mutexes;

public:
  // Blocks until no other thread holds the lock of this key.
  std::unique_lock<std::mutex> lock(const Key &key) {
    std::mutex *m;

    {
      std::lock_guard<std::mutex> guard(mutex);

      auto &p = mutexes[key];
      if (!p)
        p = std::make_unique<std::mutex>();

      m = p.get();
    }

    return std::unique_lock<std::mutex>(*m);
  }

  size_t size() {
    std::lock_guard<std::mutex> guard(mutex);

    return mutexes.size();
  }
};

} // namespace wanem
