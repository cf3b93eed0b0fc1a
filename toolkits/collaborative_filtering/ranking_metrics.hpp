/**
 * Copyright (c) 2009 Carnegie Mellon University.
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 *  Code for computing ranking metrics
 *
 *  */

#ifndef VODREC_DEF_RANKING_METRICS
#define VODREC_DEF_RANKING_METRICS

#include <set>
#include <map>
#include <vector>
#include <utility>
#include <sstream>
#include <omp.h>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "logger/logger.hpp"
#include "rating_matrix.hpp"
#include "biassgd.hpp"
#include "recommender.hpp"

namespace vodrec {

/**
 * precision = hits / |prediction|, recall = hits / |target|, each 0 when
 * its denominator is empty. Duplicate ids count once.
 */
inline std::pair<double, double> precision_recall_at_k(const std::vector<item_t> & target,
                                                       const std::vector<item_t> & prediction) {
  std::set<item_t> targets(target.begin(), target.end());
  std::set<item_t> predictions(prediction.begin(), prediction.end());
  int num_hits = 0;
  for (std::set<item_t>::const_iterator it = predictions.begin(); it != predictions.end(); ++it)
    if (targets.count(*it)) num_hits++;
  double precision = predictions.size() > 0 ? (double)num_hits / predictions.size() : 0.0;
  double recall = targets.size() > 0 ? (double)num_hits / targets.size() : 0.0;
  return std::make_pair(precision, recall);
}

struct ranking_result {
  double precision;
  double recall;
  size_t users;
  ranking_result() : precision(0), recall(0), users(0) {}
};

/**
 * Macro-averaged precision@K and recall@K over every subscriber of test.
 * Targets are the subscriber's held out items; predictions are
 * recommend(model, ratings, subscriber, K).
 */
inline ranking_result evaluate_ranking(const biassgd_model & model, const rating_matrix & ratings,
                                       const interaction_set & test, int K, int ncpus = 1) {
  if (K < 1) {
    std::ostringstream msg;
    msg << "Number of top elements (--K=) should be >= 1, got " << K;
    throw invalid_argument_error(msg.str());
  }
  if (test.empty()) {
    logstream(LOG_ERROR) << "Cannot compute precision/recall: test set is empty" << std::endl;
    throw empty_test_set_error("precision/recall requires a non-empty test set");
  }

  /* subscribers in order of first appearance, with their held out items */
  std::vector<subscriber_t> users;
  std::map<subscriber_t, std::vector<item_t> > targets;
  for (size_t k = 0; k < test.size(); k++) {
    if (targets.find(test[k].subscriber) == targets.end())
      users.push_back(test[k].subscriber);
    targets[test[k].subscriber].push_back(test[k].item);
  }

  std::vector<double> precisions(users.size()), recalls(users.size());
  omp_set_num_threads(ncpus < 1 ? 1 : ncpus);
#pragma omp parallel for
  for (int j = 0; j < (int)users.size(); j++) {
    recommendation_list top = recommend(model, ratings, users[j], K);
    std::vector<item_t> predicted;
    for (size_t r = 0; r < top.size(); r++)
      predicted.push_back(top[r].item);
    std::pair<double, double> pr = precision_recall_at_k(targets.find(users[j])->second, predicted);
    precisions[j] = pr.first;
    recalls[j] = pr.second;
  }

  ranking_result res;
  res.users = users.size();
  for (size_t j = 0; j < users.size(); j++) {
    res.precision += precisions[j];
    res.recall += recalls[j];
  }
  res.precision /= (double)res.users;
  res.recall /= (double)res.users;
  logstream(LOG_INFO) << "Computed precision@" << K << ": " << res.precision << " recall@" << K << ": "
                      << res.recall << " over " << res.users << " subscribers" << std::endl;
  return res;
}

}

#endif
