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
 */

#ifndef VODREC_EIGEN_WRAPPER
#define VODREC_EIGEN_WRAPPER

/**
 * SET OF WRAPPER FUNCTIONS FOR EIGEN
 */

#include "Eigen/Dense"

#include "util/random.hpp"

namespace vodrec {

typedef Eigen::MatrixXd mat;
typedef Eigen::VectorXd vec;
typedef Eigen::Matrix<unsigned char, Eigen::Dynamic, Eigen::Dynamic> bmat;

inline vec zeros(int size){
  return vec::Zero(size);
}
inline mat zeros(int rows, int cols){
  return mat::Zero(rows, cols);
}

/**
 * Matrix with entries drawn from N(mean, stdev^2), in row-major draw order.
 */
inline mat randn(int dx, int dy, random::generator & rng, double mean = 0, double stdev = 1){
  mat ret(dx, dy);
  for (int i=0; i< dx; i++)
    for (int j=0; j< dy; j++)
      ret(i,j) = rng.gaussian(mean, stdev);
  return ret;
}

}

#endif
