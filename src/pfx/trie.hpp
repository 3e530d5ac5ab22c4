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

#ifndef __PFX_TRIE_HPP__
#define __PFX_TRIE_HPP__

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <stdexcept>

#include <boost/optional.hpp>

#include <pfx/log.hpp>
#include <pfx/node.hpp>
#include <pfx/result.hpp>
#include <pfx/trie_interface.hpp>

namespace pfx {

    // Character-indexed prefix tree storing one or more values per key.
    //
    // Nodes are created on demand by add() and pruned by remove(), so
    // every leaf other than the root holds at least one value. Children
    // are kept in an unordered map: the order of sibling subtrees in
    // search() results is unspecified, values stored under one key come
    // out in insertion order.
    template<typename V>
    class trie : public trie_interface<V> {
    public:
        typedef trie_interface<V> base_t;
        typedef typename base_t::key_t key_t;
        typedef typename base_t::vals_t vals_t;
        typedef typename base_t::results_t results_t;
        typedef trie_node<char, V> node_t;

    private:
        typedef emit_traits<V> emit_t;

        enum class walk_mode { find, create };

        std::unique_ptr<node_t> root;

        // Single point of path resolution. In find mode a missing child
        // yields nullptr; in create mode empty nodes are inserted.
        node_t* walk(const key_t& key, walk_mode mode) {
            node_t* node = root.get();
            for(auto c : key) {
                node_t* next = node->get_or_null(c);
                if(next == nullptr) {
                    if(mode == walk_mode::find) return nullptr;
                    next = node->make(c);
                }
                node = next;
            }
            return node;
        }

        const node_t* walk(const key_t& key) const {
            return const_cast<trie*>(this)->walk(key, walk_mode::find);
        }

        // `key` names a node that was just emptied and has no children.
        // Detach it from its parent, then continue upwards while the
        // parent is left without values or children.
        void backtrace_prune(const key_t& key) {
            if(key.empty()) return;
            auto parent_key = key.substr(0, key.size() - 1);
            auto last = key.back();
            node_t* parent = walk(parent_key, walk_mode::find);
            CHECK(parent != nullptr) << "missing parent for key: " << key;
            if(parent == nullptr) return;
            parent->erase(last);
            DLOG(debug) << "pruned node: " << key;
            if(parent->is_leaf() && !parent->has_val()) {
                backtrace_prune(parent_key);
            }
        }

        void collect(const node_t* node, const key_t& path, results_t& ret) const {
            if(node->val) {
                for(const auto& v : *node->val) {
                    ret.add(emit_t::emit(v, path));
                }
            }
            for(const auto& kv : node->kids) {
                results_t sub;
                collect(kv.second.get(), path + kv.first, sub);
                ret.merge(std::move(sub));
            }
        }

    public:
        trie() : root(std::make_unique<node_t>()) {}

        trie(trie const&)            = delete;
        trie& operator=(trie const&) = delete;

        void add(const key_t& key, V val) override {
            if(key.empty()) {
                throw std::invalid_argument("trie keys must be non-empty");
            }
            walk(key, walk_mode::create)->push_val(std::move(val));
        }

        bool remove(const key_t& key) override {
            node_t* node = walk(key, walk_mode::find);
            if(node == nullptr) return false;
            node->clear_val();
            if(node->is_leaf()) {
                backtrace_prune(key);
            }
            return true;
        }

        bool is_node(const key_t& key) const override {
            return walk(key) != nullptr;
        }

        bool is_member(const key_t& key) const override {
            auto node = walk(key);
            return node != nullptr && node->has_val();
        }

        results_t search(const key_t& prefix) const override {
            results_t ret;
            auto node = walk(prefix);
            if(node != nullptr) {
                collect(node, prefix, ret);
            }
            return ret;
        }

        const vals_t& get_vals(const key_t& key) const override {
            auto node = walk(key);
            if(node == nullptr || !node->has_val()) {
                throw std::out_of_range("no values stored under key: " + key);
            }
            return *node->val;
        }

        // Longest stored key that is a prefix of `query`.
        boost::optional<key_t> longest_prefix(const key_t& query) const override {
            boost::optional<key_t> best;
            for(size_t len = 1; len <= query.size(); ++len) {
                auto candidate = query.substr(0, len);
                auto node = walk(candidate);
                if(node == nullptr) break;
                if(node->has_val()) best = candidate;
            }
            return best;
        }

        size_t num_keys()  const override { return root->num_keys(); }
        size_t num_nodes() const override { return root->size();     }
        bool   empty()     const          { return num_keys() == 0;  }

        void clear() override {
            root = std::make_unique<node_t>();
        }

        const node_t& get_root() const { return *root; }
    };
}

#endif
