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
 * @section DESCRIPTION
 *
 * Computes top K recommendations for a subscriber from the bias-SGD model.
 * Candidates are the items of the rating matrix the subscriber has no
 * visible rating for; ties in score go to the smaller item id.
 */

#ifndef VODREC_DEF_RECOMMENDER
#define VODREC_DEF_RECOMMENDER

#include <vector>
#include <sstream>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "util/toplist.hpp"
#include "rating_matrix.hpp"
#include "biassgd.hpp"

namespace vodrec {

/**
 * Top K unrated items for user, best first. Returns fewer than K entries
 * when there are fewer candidates, and an empty list when the user rated
 * every item. An unknown user has every item as a candidate.
 */
inline recommendation_list recommend(const biassgd_model & model, const rating_matrix & ratings,
                                     subscriber_t user, int K) {
  if (K < 1) {
    std::ostringstream msg;
    msg << "Number of top elements (--K=) should be >= 1, got " << K;
    throw invalid_argument_error(msg.str());
  }

  std::vector<item_t> candidates = ratings.unrated_items(user);
  std::vector<scored_value<item_t> > scored;
  scored.reserve(candidates.size());
  for (size_t j = 0; j < candidates.size(); j++)
    scored.push_back(scored_value<item_t>(candidates[j], biassgd_predict(model, user, candidates[j])));

  std::vector<scored_value<item_t> > top = get_top_values(scored, (size_t)K);
  recommendation_list out;
  out.reserve(top.size());
  for (size_t j = 0; j < top.size(); j++)
    out.push_back(recommendation(top[j].key, top[j].value));
  return out;
}

}

#endif
