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
 * Matrix factorization with the Bias Stochastic Gradient Descent (BIASSGD) algorithm.
 * Algorithm is described in the paper:
 * Y. Koren. Factorization Meets the Neighborhood: a Multifaceted Collaborative Filtering Model. ACM SIGKDD 2008. Equation (5).
 *
 * The prediction for subscriber u and item i is
 *   globalMean + b_u + b_i + p_u . q_i
 * truncated to [minval, maxval]. A subscriber or item that had no visible
 * rating during fitting is predicted as globalMean.
 *
 * fit_biassgd() returns a new model each time; a fitted model is never
 * modified afterwards.
 */

#ifndef VODREC_DEF_BIASSGD
#define VODREC_DEF_BIASSGD

#include <cmath>
#include <map>
#include <vector>
#include <sstream>
#include <algorithm>
#include <iomanip>
#include <stdint.h>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "logger/logger.hpp"
#include "util/random.hpp"
#include "util/timer.hpp"
#include "eigen_wrapper.hpp"

namespace vodrec {

struct biassgd_params {
  int D;                    // number of latent factors
  int max_iter;             // number of epochs
  double biassgd_gamma;     // step size
  double biassgd_lambda;    // regularization
  double biassgd_step_dec;  // step size multiplier applied after every epoch
  double init_std;          // stdev of the initial factor entries
  double minval;            // min allowed rating
  double maxval;            // max allowed rating
  int convergence_window;
  uint32_t seed;

  biassgd_params() : D(100), max_iter(20), biassgd_gamma(0.005), biassgd_lambda(0.02),
                     biassgd_step_dec(1.0), init_std(0.1), minval(0), maxval(1),
                     convergence_window(3), seed(0) {}
};

struct biassgd_model {
  double globalMean;
  double minval, maxval;
  std::map<subscriber_t, int> user_index;
  std::map<item_t, int> item_index;
  mat user_factors;                 // D x users, one column per subscriber
  mat item_factors;                 // D x items
  vec user_bias;
  vec item_bias;
  std::vector<double> epoch_rmse;   // training RMSE of each epoch
  bool converged;

  biassgd_model() : globalMean(0), minval(0), maxval(1), converged(true) {}

  int num_users() const { return (int)user_index.size(); }
  int num_items() const { return (int)item_index.size(); }
  bool has_user(subscriber_t u) const { return user_index.find(u) != user_index.end(); }
  bool has_item(item_t i) const { return item_index.find(i) != item_index.end(); }
};

inline void validate_biassgd_params(const biassgd_params & p) {
  std::ostringstream msg;
  if (p.D < 1)
    msg << "number of latent factors (--D) should be >= 1, got " << p.D;
  else if (p.max_iter < 1)
    msg << "number of epochs (--max_iter) should be >= 1, got " << p.max_iter;
  else if (!(p.biassgd_gamma > 0))
    msg << "step size (--biassgd_gamma) should be positive, got " << p.biassgd_gamma;
  else if (!(p.biassgd_lambda >= 0))
    msg << "regularization (--biassgd_lambda) should be >= 0, got " << p.biassgd_lambda;
  else if (!(p.biassgd_step_dec > 0))
    msg << "step decrement (--biassgd_step_dec) should be positive, got " << p.biassgd_step_dec;
  else if (!(p.init_std >= 0))
    msg << "initial factor stdev (--init_std) should be >= 0, got " << p.init_std;
  else if (!(p.minval < p.maxval))
    msg << "min allowed rating (--minval) should be smaller than max allowed rating (--maxval)";
  else if (p.convergence_window < 1)
    msg << "convergence window should be >= 1, got " << p.convergence_window;
  if (msg.str() != "")
    throw invalid_argument_error(msg.str());
}

/** compute a rating based on bias-SGD algorithm */
inline double biassgd_predict(const biassgd_model & model, subscriber_t user, item_t item) {
  std::map<subscriber_t, int>::const_iterator u = model.user_index.find(user);
  std::map<item_t, int>::const_iterator i = model.item_index.find(item);
  if (u == model.user_index.end() || i == model.item_index.end())
    return model.globalMean;

  double prediction = model.globalMean + model.user_bias[u->second] + model.item_bias[i->second]
    + model.user_factors.col(u->second).dot(model.item_factors.col(i->second));
  //truncate prediction to allowed values
  prediction = std::min(prediction, model.maxval);
  prediction = std::max(prediction, model.minval);
  return prediction;
}

/**
 * True when the loss went down over the last window epochs.
 * With a single epoch there is nothing to compare and the fit counts as
 * converged.
 */
inline bool loss_decreased(const std::vector<double> & epoch_rmse, int window) {
  if (epoch_rmse.size() < 2)
    return true;
  size_t last = epoch_rmse.size() - 1;
  size_t ref = last >= (size_t)window ? last - window : 0;
  return epoch_rmse[last] < epoch_rmse[ref];
}

/**
 * Fits the model on the visible ratings of train. Interactions without a
 * rating are skipped. Throws empty_dataset_error when nothing is rated.
 */
inline biassgd_model fit_biassgd(const interaction_set & train, const biassgd_params & params) {
  validate_biassgd_params(params);

  biassgd_model model;
  model.minval = params.minval;
  model.maxval = params.maxval;

  /* inner ids follow order of first appearance */
  std::vector<int> L_user, L_item;
  std::vector<double> L_rating;
  for (size_t k = 0; k < train.size(); k++) {
    const interaction & x = train[k];
    if (!x.rated)
      continue;
    std::map<subscriber_t, int>::iterator u = model.user_index.find(x.subscriber);
    if (u == model.user_index.end())
      u = model.user_index.insert(std::make_pair(x.subscriber, (int)model.user_index.size())).first;
    std::map<item_t, int>::iterator i = model.item_index.find(x.item);
    if (i == model.item_index.end())
      i = model.item_index.insert(std::make_pair(x.item, (int)model.item_index.size())).first;
    L_user.push_back(u->second);
    L_item.push_back(i->second);
    L_rating.push_back(x.rating);
  }

  size_t L = L_rating.size();
  if (L == 0) {
    logstream(LOG_ERROR) << "No visible ratings in the training set" << std::endl;
    throw empty_dataset_error("cannot fit bias-SGD on a training set without ratings");
  }

  double total = 0;
  for (size_t k = 0; k < L; k++) total += L_rating[k];
  model.globalMean = total / (double)L;

  random::generator rng(params.seed);
  int M = model.num_users(), N = model.num_items();
  model.user_factors = randn(params.D, M, rng, 0, params.init_std);
  model.item_factors = randn(params.D, N, rng, 0, params.init_std);
  model.user_bias = zeros(M);
  model.item_bias = zeros(N);

  logstream(LOG_INFO) << "Fitting bias-SGD: " << M << " users, " << N << " items, " << L
                      << " ratings, D=" << params.D << ", " << params.max_iter << " epochs, global mean "
                      << model.globalMean << std::endl;

  timer mytimer;
  double gamma = params.biassgd_gamma;
  const double lambda = params.biassgd_lambda;
  vec user_vec(params.D);
  for (int iteration = 0; iteration < params.max_iter; iteration++) {
    double sse = 0;
    for (size_t k = 0; k < L; k++) {
      int u = L_user[k], i = L_item[k];
      double & bu = model.user_bias[u];
      double & bi = model.item_bias[i];
      double estScore = model.globalMean + bu + bi
        + model.user_factors.col(u).dot(model.item_factors.col(i));
      double err = L_rating[k] - estScore;
      if (std::isnan(err) || std::isinf(err))
        logstream(LOG_FATAL) << "BIASSGD got into numerical error. Please tune step size using --biassgd_gamma and --biassgd_lambda" << std::endl;
      sse += err * err;

      bu += gamma * (err - lambda * bu);
      bi += gamma * (err - lambda * bi);

      user_vec = model.user_factors.col(u);
      model.user_factors.col(u) += gamma * (err * model.item_factors.col(i) - lambda * user_vec);
      model.item_factors.col(i) += gamma * (err * user_vec - lambda * model.item_factors.col(i));
    }
    double training_rmse = std::sqrt(sse / (double)L);
    model.epoch_rmse.push_back(training_rmse);
    logstream(LOG_DEBUG) << std::setw(10) << mytimer.current_time() << ") Iteration: " << std::setw(3)
                         << iteration << " Training RMSE: " << std::setw(10) << training_rmse << std::endl;
    gamma *= params.biassgd_step_dec;
  }

  model.converged = loss_decreased(model.epoch_rmse, params.convergence_window);
  if (!model.converged) {
    logstream(LOG_WARNING) << "ConvergenceWarning: training RMSE did not decrease over the last "
                           << params.convergence_window << " epochs (final " << model.epoch_rmse.back()
                           << "). Consider tuning --biassgd_gamma or --max_iter" << std::endl;
  }
  logstream(LOG_INFO) << "Finished bias-SGD in " << mytimer.current_time() << " secs, training RMSE "
                      << model.epoch_rmse.back() << std::endl;
  return model;
}

}

#endif
