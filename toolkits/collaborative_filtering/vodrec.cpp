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
 * VOD recommendation pipeline. Turns watch and content logs into implicit
 * ratings, holds out a test split, fits a biased matrix factorization with
 * SGD, reports RMSE and precision/recall@K, and publishes the top-K unseen
 * titles of one subscriber as JSON.
 *
 * Usage:
 *   ./vodrec --watch_log=watch.csv --content_log=content.csv --item_info=items.csv
 *            [--target_user=1] [--K=10] [--output=recommendation.json]
 */

#include <map>
#include <string>

#include "common.hpp"
#include "rating_matrix.hpp"
#include "biassgd.hpp"
#include "rmse.hpp"
#include "ranking_metrics.hpp"
#include "recommender.hpp"

using namespace vodrec;

void log_recommendations(const recommendation_list & list, const std::map<item_t, item_info> & catalog,
                         subscriber_t user) {
  logstream(LOG_INFO) << "Top " << list.size() << " recommendations for subscriber " << user << std::endl;
  for (size_t j = 0; j < list.size(); j++) {
    std::map<item_t, item_info>::const_iterator it = catalog.find(list[j].item);
    if (it != catalog.end())
      logger(LOG_INFO, "%d) %lld [%s] %.6f", (int)j + 1, (long long)list[j].item, it->second.name.c_str(), list[j].score);
    else
      logger(LOG_INFO, "%d) %lld %.6f", (int)j + 1, (long long)list[j].item, list[j].score);
  }
}

int run_pipeline(metrics & m) {
  pipeline_options opts = parse_pipeline_options();
  if (global_logger().get_log_level() <= LOG_INFO)
    print_config(opts);

  /* Load the log snapshots */
  metrics_entry me = m.start_time();
  std::vector<watch_event> watch_log =
    load_watch_events(read_table(opts.watch_log, "watch_log", opts.delimiter));
  std::vector<content_event> content_log =
    load_content_events(read_table(opts.content_log, "content_log", opts.delimiter));
  std::map<item_t, item_info> catalog =
    extract_item_catalog(load_item_catalog(read_table(opts.item_info, "item_info", opts.delimiter)));

  interaction_set interactions = extract_interactions(watch_log, content_log, opts.minval, opts.maxval);
  m.stop_time(me, "extract");
  m.set("interactions", interactions.size());
  m.set("rated_interactions", count_rated(interactions));

  me = m.start_time();
  split_result split = split_interactions(interactions, opts.test_fraction, opts.seed);
  m.stop_time(me, "split");
  m.set("train_ratings", count_rated(split.train));
  m.set("test_ratings", split.test.size());

  rating_matrix ratings = build_rating_matrix(split.train);
  m.set("users", (size_t)ratings.num_users());
  m.set("items", (size_t)ratings.num_items());

  me = m.start_time();
  biassgd_model model = fit_biassgd(split.train, to_biassgd_params(opts));
  m.stop_time(me, "fit", true);
  for (size_t j = 0; j < model.epoch_rmse.size(); j++)
    m.add_to_vector("epoch_rmse", model.epoch_rmse[j]);
  m.set("converged", model.converged ? 1 : 0);

  me = m.start_time();
  double test_rmse = calculate_rmse(model, split.test);
  ranking_result ranking = evaluate_ranking(model, ratings, split.test, opts.K, opts.ncpus);
  m.stop_time(me, "evaluate");
  m.set("test_rmse", test_rmse);
  m.set("precision_at_k", ranking.precision);
  m.set("recall_at_k", ranking.recall);

  if (!model.has_user(opts.target_user))
    logstream(LOG_WARNING) << "Subscriber " << opts.target_user << " has no training ratings, "
                           << "recommendations fall back to the global mean" << std::endl;
  me = m.start_time();
  recommendation_list top = recommend(model, ratings, opts.target_user, opts.K);
  m.stop_time(me, "recommend");
  if (top.empty())
    logstream(LOG_WARNING) << "Subscriber " << opts.target_user << " has no unwatched items to recommend" << std::endl;
  log_recommendations(top, catalog, opts.target_user);

  me = m.start_time();
  write_recommendations_json(opts.output, top);
  m.stop_time(me, "serialize");
  return 0;
}

int main(int argc, const char ** argv) {
  /* vodrec initialization will read the command line arguments and the configuration file. */
  vodrec_init(argc, argv);

  /* Metrics object for keeping track of performance counters
     and other information. */
  metrics m("vodrec");

  try {
    setup_logging();
    run_pipeline(m);
  } catch (const vodrec_error & e) {
    logstream(LOG_ERROR) << "Pipeline aborted: " << e.what() << std::endl;
    metrics_report(m);
    return 1;
  }

  /* Report execution metrics */
  metrics_report(m);
  return 0;
}
