/**
 * @file
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Carnegie Mellon University]
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
 * Dense subscriber x item table of the training interactions. Rows and
 * columns are ordered by ascending id. A cell is either rated (value
 * visible to the model) or empty, which covers both pairs never seen and
 * pairs whose rating was held out.
 */

#ifndef VODREC_DEF_RATING_MATRIX
#define VODREC_DEF_RATING_MATRIX

#include <map>
#include <vector>
#include <algorithm>

#include "vodrec_types.hpp"
#include "logger/logger.hpp"
#include "eigen_wrapper.hpp"

namespace vodrec {

struct rating_matrix {
  std::vector<subscriber_t> users;          // row -> subscriber id
  std::vector<item_t> items;                // column -> item id
  std::map<subscriber_t, int> user_row;
  std::map<item_t, int> item_col;
  mat values;
  bmat known;

  int num_users() const { return (int)users.size(); }
  int num_items() const { return (int)items.size(); }

  /** row of subscriber u, or -1 when unknown */
  int row_of(subscriber_t u) const {
    std::map<subscriber_t, int>::const_iterator it = user_row.find(u);
    return it == user_row.end() ? -1 : it->second;
  }
  int col_of(item_t i) const {
    std::map<item_t, int>::const_iterator it = item_col.find(i);
    return it == item_col.end() ? -1 : it->second;
  }

  bool is_rated(subscriber_t u, item_t i) const {
    int r = row_of(u), c = col_of(i);
    return r >= 0 && c >= 0 && known(r, c) != 0;
  }

  /** items with a visible rating for u; empty for an unknown subscriber */
  std::vector<item_t> rated_items(subscriber_t u) const {
    std::vector<item_t> out;
    int r = row_of(u);
    if (r < 0) return out;
    for (int c = 0; c < num_items(); c++)
      if (known(r, c)) out.push_back(items[c]);
    return out;
  }

  /** items without a visible rating for u, ascending id */
  std::vector<item_t> unrated_items(subscriber_t u) const {
    int r = row_of(u);
    if (r < 0) return items;
    std::vector<item_t> out;
    for (int c = 0; c < num_items(); c++)
      if (!known(r, c)) out.push_back(items[c]);
    return out;
  }
};

/**
 * Pivots the training interactions into a rating_matrix. Every
 * interaction contributes its subscriber and item, rated or not.
 */
inline rating_matrix build_rating_matrix(const interaction_set & train) {
  rating_matrix m;
  for (size_t k = 0; k < train.size(); k++) {
    m.users.push_back(train[k].subscriber);
    m.items.push_back(train[k].item);
  }
  std::sort(m.users.begin(), m.users.end());
  m.users.erase(std::unique(m.users.begin(), m.users.end()), m.users.end());
  std::sort(m.items.begin(), m.items.end());
  m.items.erase(std::unique(m.items.begin(), m.items.end()), m.items.end());

  for (int r = 0; r < m.num_users(); r++) m.user_row[m.users[r]] = r;
  for (int c = 0; c < m.num_items(); c++) m.item_col[m.items[c]] = c;

  m.values = zeros(m.num_users(), m.num_items());
  m.known = bmat::Zero(m.num_users(), m.num_items());
  size_t nrated = 0;
  for (size_t k = 0; k < train.size(); k++) {
    if (!train[k].rated)
      continue;
    int r = m.user_row[train[k].subscriber];
    int c = m.item_col[train[k].item];
    m.values(r, c) = train[k].rating;
    m.known(r, c) = 1;
    nrated++;
  }

  logstream(LOG_INFO) << "Rating matrix: " << m.num_users() << " subscribers x " << m.num_items()
                      << " items, " << nrated << " visible ratings" << std::endl;
  return m;
}

}

#endif
