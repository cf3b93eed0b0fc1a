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
 * Train / test split of the interaction set.
 *
 * A fraction of the rated interactions is sampled into the test set. The
 * training set keeps every interaction, but the sampled rows lose their
 * rating, so the rating matrix keeps its shape and the held-out values
 * never reach the model.
 */

#ifndef VODREC_DEF_SPLIT
#define VODREC_DEF_SPLIT

#include <cmath>
#include <vector>
#include <sstream>
#include <algorithm>
#include <stdint.h>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "logger/logger.hpp"
#include "util/random.hpp"

namespace vodrec {

    struct split_result {
        interaction_set train;
        interaction_set test;
    };

    /**
     * Splits interactions into train and test.
     * @param interactions extracted interaction set
     * @param test_fraction share of rated interactions held out, in (0,1)
     * @param seed sampling seed
     */
    static split_result split_interactions(const interaction_set & interactions,
                                           double test_fraction = 0.25, uint32_t seed = 0) {
        if (!(test_fraction > 0 && test_fraction < 1)) {
            std::ostringstream msg;
            msg << "test fraction must be in (0,1), got " << test_fraction;
            throw invalid_argument_error(msg.str());
        }

        std::vector<size_t> rated;
        for (size_t i = 0; i < interactions.size(); i++)
            if (interactions[i].rated) rated.push_back(i);

        if (rated.size() < 2) {
            std::ostringstream msg;
            msg << "need at least 2 rated interactions to split, got " << rated.size();
            logstream(LOG_ERROR) << msg.str() << std::endl;
            throw empty_dataset_error(msg.str());
        }

        size_t ntest = (size_t)std::ceil(test_fraction * (double)rated.size());
        ntest = std::max((size_t)1, std::min(ntest, rated.size() - 1));

        random::generator rng(seed);
        rng.shuffle(rated);
        std::vector<size_t> held_out(rated.begin(), rated.begin() + ntest);
        std::sort(held_out.begin(), held_out.end());

        split_result out;
        out.train = interactions;
        out.test.reserve(ntest);
        for (size_t k = 0; k < held_out.size(); k++) {
            size_t pos = held_out[k];
            out.test.push_back(interactions[pos]);
            out.train[pos].rated = false;
            out.train[pos].rating = 0;
        }

        logstream(LOG_INFO) << "Split " << rated.size() << " rated interactions into "
                            << rated.size() - ntest << " train and " << ntest << " test ratings (seed "
                            << seed << ")" << std::endl;
        return out;
    }

}

#endif
