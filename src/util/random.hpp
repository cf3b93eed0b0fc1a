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
 * Seeded random number generation. A generator is always built from an
 * explicit seed and handed to the code that needs it, so two runs with the
 * same seed draw the same numbers.
 */

#ifndef VODREC_RANDOM_HPP
#define VODREC_RANDOM_HPP

#include <algorithm>
#include <vector>
#include <cstddef>
#include <stdint.h>

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>

namespace vodrec {
  namespace random {

    class generator {
    public:
      typedef boost::random::mt19937 rng_type;

      explicit generator(uint32_t seed_value) : rng(seed_value) { }

      /**
       * Generate a random number in the inclusive range [min, max].
       */
      template<typename IntType>
      inline IntType fast_uniform(const IntType min, const IntType max) {
        boost::random::uniform_int_distribution<IntType> dist(min, max);
        return dist(rng);
      }

      /**
       * Generate a gaussian random variable with the given mean and
       * standard deviation.
       */
      inline double gaussian(const double mean = double(0),
                             const double stdev = double(1)) {
        boost::random::normal_distribution<double> normal_dist(mean, stdev);
        return normal_dist(rng);
      }

      /**
       * Fisher-Yates shuffle of the whole vector.
       */
      template<typename T>
      void shuffle(std::vector<T>& vec) {
        if (vec.size() < 2) return;
        for (size_t i = vec.size() - 1; i > 0; --i) {
          size_t j = fast_uniform<size_t>(0, i);
          std::swap(vec[i], vec[j]);
        }
      }

    private:
      rng_type rng;
    }; // end of class generator

  }
}

#endif
