//
//  Map wrapper where we can iterate through
//  items in insertion-order.
//

#pragma once

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <map>
#include <utility>
#include <vector>

namespace kdlgen {

template <typename T, typename V>
struct OrderedMap {
    using Map = std::map<T, V>;
    Map m_;

    // Array of all map keys in `insert-order`
    std::vector<T> keys_;

    OrderedMap() = default;
    OrderedMap(const OrderedMap& other) = default;
    OrderedMap(OrderedMap&& other) = default;

    OrderedMap(const std::initializer_list<std::pair<T, V>> kw_args) {
        for (auto& [key, value] : kw_args) {
            insert(key, value);
        }
    }

    // Inserting an existing key replaces the value but keeps the
    // original position.
    void
    insert(const T& key, V value) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        m_.insert_or_assign(key, std::move(value));
    }

    bool
    remove(const T& key) {
        if (contains(key)) {
            keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
            m_.erase(key);
            return true;
        }
        return false;
    }

    OrderedMap&
    operator=(const OrderedMap& other) = default;

    OrderedMap&
    operator=(OrderedMap&& other) = default;

    V&
    operator[](const T& key) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        return m_[key];
    }

    const V&
    at(const T& key) const {
        return m_.at(key);
    }

    const std::vector<T>&
    keys() const {
        return keys_;
    }

    std::size_t
    size() const {
        return m_.size();
    }

    bool
    empty() const {
        return m_.empty();
    }

    bool
    contains(const T& s) const {
        return m_.contains(s);
    }

    void
    for_each(std::function<void(const T&, V&)> cb) {
        for (auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }

    void
    for_each(std::function<void(const T&, const V&)> cb) const {
        for (auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }

    // Iterate until the callback returns false. Returns false if the
    // iteration was stopped early.
    bool
    for_each_until(std::function<bool(const T&, const V&)> cb) const {
        for (auto& k : keys_) {
            if (!cb(k, m_.at(k))) {
                return false;
            }
        }
        return true;
    }
};

}  // namespace kdlgen
