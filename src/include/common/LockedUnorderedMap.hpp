// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Toolgate a resilient tool-serving process.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef TOOLGATE_LOCKED_UNORDERED_MAP_H
#define TOOLGATE_LOCKED_UNORDERED_MAP_H

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include <cstddef>

namespace toolgate {

template <typename Key, typename Value>
class LockedUnorderedMap {
public:
    // Copy of the element under a read lock
    std::optional<Value> get(const Key& key) const {
        std::shared_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const Key& key) const {
        std::shared_lock lock{mutex};
        return map.contains(key);
    }

    void insert_or_assign(const Key& key, Value value) {
        std::unique_lock lock{mutex};
        map.insert_or_assign(key, std::move(value));
    }

    // Runs f(value, inserted) on the element for key, default constructing it
    // first if absent. The whole read-modify-write holds the write lock.
    template<typename F>
    auto upsert(const Key& key, F&& f) {
        std::unique_lock lock{mutex};
        auto [it, inserted] = map.try_emplace(key);
        return std::forward<F>(f)(it->second, inserted);
    }

    bool erase(const Key& key) {
        std::unique_lock lock{mutex};
        return map.erase(key) > 0;
    }

    // Removes every element for which pred(key, value) holds; returns how many.
    template<typename Pred>
    std::size_t eraseIf(Pred pred) {
        std::unique_lock lock{mutex};
        return std::erase_if(map, [&pred](const auto& kv) { return pred(kv.first, kv.second); });
    }

    template<typename F>
    void forEach(F f) const {
        std::shared_lock lock{mutex};
        for (const auto& [k, v] : map) {
            f(k, v);
        }
    }

    std::vector<Key> keys() const {
        std::shared_lock lock{mutex};
        std::vector<Key> out;
        out.reserve(map.size());
        for (const auto& kv : map) {
            out.push_back(kv.first);
        }
        return out;
    }

    void clear() {
        std::unique_lock lock{mutex};
        map.clear();
    }

    // Size with read lock
    size_t size() const {
        std::shared_lock lock{mutex};
        return map.size();
    }

private:
    std::unordered_map<Key, Value> map;
    mutable std::shared_mutex mutex;
};

} // namespace toolgate

#endif // TOOLGATE_LOCKED_UNORDERED_MAP_H
