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

#include <iostream>
#include <algorithm>
#include <string>
#include <vector>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/timer/timer.hpp>

#include <gflags/gflags.h>

#include <pfx/log.hpp>
#include <pfx/trie.hpp>
#include <pfx/reader.hpp>

using namespace pfx;

DEFINE_string(dict, "", "path to key<TAB>value dictionary");
DEFINE_string(query, "", "comma-separated prefixes to search");
DEFINE_string(remove, "", "comma-separated keys removed before querying");
DEFINE_bool(longest, false, "print the longest stored prefix of each query");
DEFINE_uint64(max_results, 0, "maximum entries printed per query (0 = all)");
DEFINE_bool(interactive, false, "read one prefix per line from stdin");
DEFINE_string(log_level, "info", "trace | debug | info | warning | error | fatal");

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> toks;
    if (s.empty()) return toks;
    boost::split(toks, s, boost::is_any_of(","));
    return toks;
}

void print_search(const dictionary& dict, const std::string& prefix) {
    auto rs = dict.search(prefix);
    std::vector<dictionary::results_t::entry_type> entries(rs.begin(), rs.end());
    std::stable_sort(entries.begin(), entries.end(),
                     [](const dictionary::results_t::entry_type& a,
                        const dictionary::results_t::entry_type& b) {
                         return *a.get_key() < *b.get_key();
                     });
    size_t n = 0;
    for (const auto& e : entries) {
        if (FLAGS_max_results > 0 && n >= FLAGS_max_results) break;
        std::cout << *e.get_key() << "\t" << e.get_val() << std::endl;
        n ++;
    }
    LOG(INFO) << "prefix [" << prefix << "]: " << entries.size() << " matches";
}

void print_longest(const dictionary& dict, const std::string& query) {
    auto key = dict.longest_prefix(query);
    if (key) {
        std::cout << query << "\t" << *key << std::endl;
    } else {
        LOG(INFO) << "no stored prefix of [" << query << "]";
    }
}

void answer(const dictionary& dict, const std::string& query) {
    if (FLAGS_longest) {
        print_longest(dict, query);
    } else {
        print_search(dict, query);
    }
}

int main(int argc, char **argv) {
    // Parse command line flags
    gflags::SetUsageMessage("prefix search over a key<TAB>value dictionary");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (!set_log_level(FLAGS_log_level)) {
        LOG(FATAL) << "unknown log level: " << FLAGS_log_level;
        return 1;
    }

    LOG(INFO) << "Dictionary path: " << FLAGS_dict;
    LOG(INFO) << "Longest prefix mode: " << FLAGS_longest;

    if (FLAGS_dict == "") {
        LOG(FATAL) << "must supply path to dictionary!";
        return 1;
    }

    if (FLAGS_query == "" && !FLAGS_interactive) {
        LOG(FATAL) << "must supply --query or --interactive!";
        return 1;
    }

    boost::timer::auto_cpu_timer t(std::cerr);

    dictionary dict;
    try {
        read_dictionary(FLAGS_dict, dict);
    } catch (const std::runtime_error& e) {
        LOG(FATAL) << e.what();
        return 1;
    }
    LOG(INFO) << dict.num_keys() << " keys in " << dict.num_nodes() << " nodes";

    for (const auto& key : split_list(FLAGS_remove)) {
        if (!dict.remove(key)) {
            LOG(WARNING) << "not in dictionary: " << key;
        }
    }

    for (const auto& q : split_list(FLAGS_query)) {
        answer(dict, q);
    }

    if (FLAGS_interactive) {
        std::string line;
        while (std::getline(std::cin, line)) {
            boost::trim_right_if(line, boost::is_any_of("\r\n"));
            answer(dict, line);
        }
    }

    return 0;
}
