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

#ifndef __PFX_READER_HPP__
#define __PFX_READER_HPP__

#include <string>
#include <vector>
#include <fstream>
#include <istream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include <pfx/log.hpp>
#include <pfx/trie.hpp>

namespace pfx {

    typedef trie<std::string> dictionary;

    // Reads `key<TAB>value` lines into `dict`. Blank lines are skipped and
    // a line holding only a key stores an empty value. Returns the number
    // of entries added.
    inline size_t read_dictionary(std::istream& in, dictionary& dict) {
        size_t line_num = 0;
        size_t added = 0;
        std::string line;
        while (std::getline(in, line)) {
            line_num ++;
            boost::trim_right_if(line, boost::is_any_of("\r\n"));
            if (boost::trim_copy(line).empty()) continue;
            std::vector<std::string> toks;
            boost::split(toks, line, boost::is_any_of("\t"));
            if (toks.size() > 2) {
                throw std::runtime_error("line " + std::to_string(line_num) +
                                         ": expected key<TAB>value");
            }
            if (toks[0].empty()) {
                throw std::runtime_error("line " + std::to_string(line_num) +
                                         ": empty key");
            }
            dict.add(toks[0], toks.size() == 2 ? toks[1] : std::string());
            added ++;
        }
        LOG(INFO) << "read " << added << " entries (" << line_num << " lines)";
        return added;
    }

    inline size_t read_dictionary(const std::string& path, dictionary& dict) {
        std::ifstream infile;
        infile.open(path);
        if(!infile) {
            throw std::runtime_error("error reading: [" + path + "]");
        }
        LOG(INFO) << "reading dictionary: " << path;
        return read_dictionary(infile, dict);
    }
}

#endif
