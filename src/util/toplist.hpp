/**
 * @file
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Aapo Kyrola, Guy Blelloch, Carlos Guestrin / Carnegie Mellon University]
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.


 *
 * @section DESCRIPTION
 *
 * Tools for listing the TOP K scored entries.
 */

#ifndef VODREC_TOPLIST_HPP
#define VODREC_TOPLIST_HPP

#include <vector>
#include <algorithm>

namespace vodrec {

    template <typename KeyType>
    struct scored_value {
        KeyType key;
        double value;
        scored_value() : key(), value(0) {}
        scored_value(KeyType k, double x) : key(k), value(x) {}
    };

    /**
     * Orders by value descending, equal values by key ascending, so the
     * resulting list does not depend on input order.
     */
    template <typename KeyType>
    bool scored_value_greater(const scored_value<KeyType> &a, const scored_value<KeyType> &b) {
        if (a.value != b.value) return a.value > b.value;
        return a.key < b.key;
    }

    /**
      * Returns the top ntop entries of values in descending order.
      * If ntop is larger than the number of values, returns all of them sorted.
      * @param values candidate entries, consumed
      * @param ntop number of top values to return
      */
    template <typename KeyType>
    std::vector<scored_value<KeyType> > get_top_values(std::vector<scored_value<KeyType> > values, size_t ntop) {
        if (ntop > values.size()) {
            ntop = values.size();
        }
        std::partial_sort(values.begin(), values.begin() + ntop, values.end(),
                          scored_value_greater<KeyType>);
        values.resize(ntop);
        return values;
    }

}

#endif
