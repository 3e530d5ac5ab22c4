/*
 * Copyright 2015-2016 Nicholas Andrews
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#ifndef __PFX_RESULT_HPP__
#define __PFX_RESULT_HPP__

#include <string>
#include <vector>
#include <utility>

#include <boost/optional.hpp>

namespace pfx {

    template<typename V>
    class result_entry {
        V val;
        boost::optional<std::string> key;

    public:
        typedef V value_type;

        explicit result_entry(V _val)
            : val(std::move(_val)) {}

        result_entry(V _val, std::string _key)
            : val(std::move(_val)), key(std::move(_key)) {}

        const V& get_val() const { return val;                     }
        bool has_key()     const { return static_cast<bool>(key);  }

        const boost::optional<std::string>& get_key() const { return key; }

        void set_key(std::string _key) { key = std::move(_key); }

        bool operator==(const result_entry& other) const {
            return val == other.val && key == other.key;
        }

        bool operator!=(const result_entry& other) const {
            return !(*this == other);
        }
    };

    template<typename V>
    class result_collection {
        typedef std::vector<result_entry<V>> entries_t;
        entries_t entries;

    public:
        typedef result_entry<V> entry_type;
        typedef typename entries_t::const_iterator const_iterator;

        void add(entry_type entry) {
            entries.push_back(std::move(entry));
        }

        // Appends the entries of `other` in their order.
        void merge(const result_collection& other) {
            entries.insert(entries.end(), other.begin(), other.end());
        }

        void merge(result_collection&& other) {
            for(auto& e : other.entries) {
                entries.push_back(std::move(e));
            }
            other.entries.clear();
        }

        const entry_type& at(size_t i) const { return entries.at(i); }

        size_t size()  const { return entries.size();  }
        bool   empty() const { return entries.empty(); }

        const_iterator begin() const { return entries.begin(); }
        const_iterator end()   const { return entries.end();   }
    };

    // How a stored value becomes a search result. Plain values are
    // labelled with the path they were found under; stored entries are
    // cloned and keep whatever key they already carry.
    template<typename V>
    struct emit_traits {
        typedef result_collection<V> collection_type;

        static result_entry<V> emit(const V& v, const std::string& path) {
            return result_entry<V>(v, path);
        }
    };

    template<typename U>
    struct emit_traits<result_entry<U>> {
        typedef result_collection<U> collection_type;

        static result_entry<U> emit(const result_entry<U>& stored,
                                    const std::string& path) {
            result_entry<U> ret(stored);
            if(!ret.has_key()) {
                ret.set_key(path);
            }
            return ret;
        }
    };
}

#endif
