// idpack/utility/lrucache.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/system/common.hpp"
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace idpack {

//! Bounded key-value memo with least-recently-used eviction
/*!
 * find() refreshes the entry, insert() refreshes or adds it and evicts
 * from the cold end until size() <= capacity().
 * Not synchronized.
 */
template <class Key, class Value, class Hash = std::hash<Key>, class KeyEqual = std::equal_to<Key>>
class LruCache {
    using KeyListT = std::list<Key>;

    struct Entry {
        template <class V>
        Entry(V&& _value, typename KeyListT::iterator _lru_it)
            : value_(std::forward<V>(_value))
            , lru_it_(_lru_it)
        {
        }

        Value                       value_;
        typename KeyListT::iterator lru_it_;
    };

    using MapT = std::unordered_map<Key, Entry, Hash, KeyEqual>;

    size_t   capacity_;
    MapT     map_;
    KeyListT lru_;

public:
    explicit LruCache(const size_t _capacity)
        : capacity_(_capacity)
    {
    }

    size_t capacity() const
    {
        return capacity_;
    }

    size_t size() const
    {
        return map_.size();
    }

    bool empty() const
    {
        return map_.empty();
    }

    const Value* find(const Key& _rkey)
    {
        const auto it = map_.find(_rkey);
        if (it == map_.end()) {
            return nullptr;
        }
        touch(it->second);
        return &it->second.value_;
    }

    bool contains(const Key& _rkey) const
    {
        return map_.find(_rkey) != map_.end();
    }

    template <class V>
    void insert(const Key& _rkey, V&& _value)
    {
        if (capacity_ == 0) {
            return;
        }
        auto it = map_.find(_rkey);
        if (it == map_.end()) {
            lru_.push_back(_rkey);
            map_.emplace(_rkey, Entry(std::forward<V>(_value), std::prev(lru_.end())));
        } else {
            it->second.value_ = std::forward<V>(_value);
            touch(it->second);
        }
        evictIfNeeded();
    }

    void clear()
    {
        map_.clear();
        lru_.clear();
    }

private:
    void touch(Entry& _rentry)
    {
        lru_.splice(lru_.end(), lru_, _rentry.lru_it_);
    }

    void evictIfNeeded()
    {
        while (map_.size() > capacity_ && !lru_.empty()) {
            map_.erase(lru_.front());
            lru_.pop_front();
        }
    }
};

} // namespace idpack
