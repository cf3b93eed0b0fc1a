#ifndef VODREC_DEF_RMSEHPP
#define VODREC_DEF_RMSEHPP
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
 * Prediction error of a fitted model over held out ratings.
 */

#include <cmath>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "logger/logger.hpp"
#include "biassgd.hpp"

namespace vodrec {

/**
  compute test rmse over the rated rows of test
  */
inline double calculate_rmse(const biassgd_model & model, const interaction_set & test) {
  double sse = 0;
  size_t Le = 0;
  for (size_t k = 0; k < test.size(); k++) {
    if (!test[k].rated)
      continue;
    double err = test[k].rating - biassgd_predict(model, test[k].subscriber, test[k].item);
    sse += err * err;
    Le++;
  }
  if (Le == 0) {
    logstream(LOG_ERROR) << "Cannot compute RMSE: test set has no ratings" << std::endl;
    throw empty_test_set_error("RMSE requires a non-empty test set");
  }
  double rmse = std::sqrt(sse / (double)Le);
  logstream(LOG_INFO) << "Test RMSE: " << rmse << " over " << Le << " ratings" << std::endl;
  return rmse;
}

}

#endif //VODREC_DEF_RMSEHPP
