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

#ifndef __PFX_TRIE_INTERFACE__
#define __PFX_TRIE_INTERFACE__

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <pfx/result.hpp>

namespace pfx {

    template<typename V>
    class trie_interface {
    public:
        typedef std::string key_t;
        typedef std::vector<V> vals_t;
        typedef typename emit_traits<V>::collection_type results_t;

        virtual ~trie_interface() {}

        virtual void add(const key_t& key, V val) = 0;
        virtual bool remove(const key_t& key) = 0;
        virtual bool is_node(const key_t& key) const = 0;
        virtual bool is_member(const key_t& key) const = 0;
        virtual results_t search(const key_t& prefix) const = 0;

        virtual const vals_t& get_vals(const key_t& key) const = 0;
        virtual boost::optional<key_t> longest_prefix(const key_t& query) const = 0;
        virtual size_t num_keys() const = 0;
        virtual size_t num_nodes() const = 0;
        virtual void clear() = 0;
    };

};

#endif
