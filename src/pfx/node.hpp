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

#ifndef __PFX_NODE_HPP__
#define __PFX_NODE_HPP__

#include <unordered_map>
#include <vector>
#include <memory>
#include <utility>

#include <boost/optional.hpp>

namespace pfx {

    // A trie vertex. `val` is absent on nodes that only spell a path
    // towards longer keys.
    template<typename T, typename V>
    struct trie_node {
        typedef std::vector<V> vals_t;
        typedef std::unordered_map<T, std::unique_ptr<trie_node>> kids_t;

        boost::optional<vals_t> val;
        kids_t kids;

        trie_node() {}
        trie_node(trie_node const&)            = delete;
        trie_node& operator=(trie_node const&) = delete;
        ~trie_node() {}

        trie_node* get_or_null(T t) const {
            auto it = kids.find(t);
            if(it != kids.end()) return it->second.get();
            return nullptr;
        }

        trie_node* get(T t) const {
            return kids.at(t).get();
        }

        trie_node* make(T t) {
            kids[t] = std::make_unique<trie_node>();
            return kids[t].get();
        }

        trie_node* get_or_make(T t) {
            if(kids.count(t) == 0) {
                return make(t);
            }
            return get(t);
        }

        bool erase(T t)         { return kids.erase(t) > 0; }
        bool has(T t)     const { return kids.count(t) > 0; }
        bool has_val()    const { return static_cast<bool>(val); }
        bool is_leaf()    const { return kids.empty();      }
        size_t num_kids() const { return kids.size();       }

        void push_val(V v) {
            if(!val) {
                val = vals_t { std::move(v) };
            } else {
                val->push_back(std::move(v));
            }
        }

        void clear_val() { val = boost::none; }

        // Number of nodes in this subtree, this node included.
        size_t size() const {
            size_t n = 1;
            for(const auto& kv : kids) {
                n += kv.second->size();
            }
            return n;
        }

        size_t num_keys() const {
            size_t n = has_val() ? 1 : 0;
            for(const auto& kv : kids) {
                n += kv.second->num_keys();
            }
            return n;
        }
    };
}

#endif
