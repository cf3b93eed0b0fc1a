#ifndef VODREC_COMMON_H__
#define VODREC_COMMON_H__

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
 */

#include <cmath>
#include <string>
#include <sstream>
#include <iostream>
#include <stdint.h>

#include "vodrec_basic_includes.hpp"
#include "biassgd.hpp"

namespace vodrec {

/* Every tunable of one pipeline run */
struct pipeline_options {
  std::string watch_log;
  std::string content_log;
  std::string item_info;
  char delimiter;
  std::string output;

  double test_fraction;
  uint32_t seed;

  int D;
  int max_iter;
  double biassgd_gamma;
  double biassgd_lambda;
  double biassgd_step_dec;
  double init_std;
  double minval;
  double maxval;
  int convergence_window;

  int K;
  subscriber_t target_user;
  int ncpus;

  pipeline_options() : delimiter(','), output("recommendation.json"), test_fraction(0.25), seed(0),
                       D(100), max_iter(20), biassgd_gamma(0.005), biassgd_lambda(0.02),
                       biassgd_step_dec(1.0), init_std(0.1), minval(0), maxval(1),
                       convergence_window(3), K(10), target_user(0), ncpus(1) {}
};

inline biassgd_params to_biassgd_params(const pipeline_options & opts) {
  biassgd_params p;
  p.D = opts.D;
  p.max_iter = opts.max_iter;
  p.biassgd_gamma = opts.biassgd_gamma;
  p.biassgd_lambda = opts.biassgd_lambda;
  p.biassgd_step_dec = opts.biassgd_step_dec;
  p.init_std = opts.init_std;
  p.minval = opts.minval;
  p.maxval = opts.maxval;
  p.convergence_window = opts.convergence_window;
  p.seed = opts.seed;
  return p;
}

/**
 * Applies quiet, log_level, log_file and log_to_console to the global logger.
 */
inline void setup_logging() {
  int quiet = get_option_int("quiet", 0);
  int level = get_option_int("log_level", LOG_INFO);
  if (level < LOG_DEBUG || level > LOG_FATAL)
    throw invalid_argument_error("log level (--log_level) should be between 0 and 4");
  global_logger().set_log_level(quiet ? LOG_ERROR : level);

  std::string log_file = get_option_string("log_file", "");
  if (log_file != "" && !global_logger().set_log_file(log_file))
    logstream(LOG_WARNING) << "Could not open log file " << log_file << ", logging to console only" << std::endl;
  else if (log_file != "")
    global_logger().set_log_to_console(get_option_int("log_to_console", 1) != 0);
}

inline pipeline_options parse_pipeline_options() {
  pipeline_options opts;
  opts.watch_log   = get_option_string("watch_log");
  opts.content_log = get_option_string("content_log");
  opts.item_info   = get_option_string("item_info");

  std::string delim = get_option_string("delimiter", ",");
  if (delim == "\\t" || delim == "tab")
    delim = "\t";
  if (delim.size() != 1)
    throw invalid_argument_error("delimiter (--delimiter) should be a single character, got [" + delim + "]");
  opts.delimiter = delim[0];
  opts.output = get_option_string("output", opts.output);

  opts.test_fraction      = get_option_float("test_fraction", opts.test_fraction);
  opts.seed               = (uint32_t)get_option_long("seed", opts.seed);
  opts.D                  = get_option_int("D", opts.D);
  opts.max_iter           = get_option_int("max_iter", opts.max_iter);
  opts.biassgd_gamma      = get_option_float("biassgd_gamma", opts.biassgd_gamma);
  opts.biassgd_lambda     = get_option_float("biassgd_lambda", opts.biassgd_lambda);
  opts.biassgd_step_dec   = get_option_float("biassgd_step_dec", opts.biassgd_step_dec);
  opts.init_std           = get_option_float("init_std", opts.init_std);
  opts.minval             = get_option_float("minval", opts.minval);
  opts.maxval             = get_option_float("maxval", opts.maxval);
  opts.convergence_window = get_option_int("convergence_window", opts.convergence_window);
  opts.K                  = get_option_int("K", opts.K);
  opts.target_user        = (subscriber_t)get_option_long("target_user", opts.target_user);
  opts.ncpus              = get_option_int("ncpus", opts.ncpus);

  if (!(opts.test_fraction > 0 && opts.test_fraction < 1))
    throw invalid_argument_error("test fraction (--test_fraction) should be in (0,1)");
  if (opts.K < 1)
    throw invalid_argument_error("Number of top elements (--K=) should be >= 1");
  if (opts.ncpus < 1)
    throw invalid_argument_error("number of threads (--ncpus) should be >= 1");
  validate_biassgd_params(to_biassgd_params(opts));
  return opts;
}

inline void print_config(const pipeline_options & opts) {
  std::cout << "[feature_width] => [" << opts.D << "]" << std::endl;
  std::cout << "[max_iter] => [" << opts.max_iter << "]" << std::endl;
  std::cout << "[biassgd_gamma] => [" << opts.biassgd_gamma << "]" << std::endl;
  std::cout << "[biassgd_lambda] => [" << opts.biassgd_lambda << "]" << std::endl;
  std::cout << "[test_fraction] => [" << opts.test_fraction << "]" << std::endl;
  std::cout << "[seed] => [" << opts.seed << "]" << std::endl;
  std::cout << "[K] => [" << opts.K << "]" << std::endl;
  std::cout << "[target_user] => [" << opts.target_user << "]" << std::endl;
  std::cout << "[number_of_threads] => [" << opts.ncpus << "]" << std::endl;
}

}

#endif //VODREC_COMMON_H__
