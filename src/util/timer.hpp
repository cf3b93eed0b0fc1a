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
 * Wall clock timer with microsecond resolution.
 *
 * \code
 * vodrec::timer t;
 * // do something
 * logstream(LOG_INFO) << "Elapsed time: " << t.current_time() << std::endl;
 * \endcode
 */


#ifndef VODREC_TIMER_HPP
#define VODREC_TIMER_HPP

#include <sys/time.h>
#include <stddef.h>

namespace vodrec {

  class timer {
  private:
    timeval start_time_;
  public:
    /**
     * \brief The timer starts on construction but can be restarted by
     * calling start().
     */
    inline timer() { start(); }

    inline void start() { gettimeofday(&start_time_, NULL); }

    /**
     * \brief Returns the elapsed time in seconds since start() was last called.
     */
    inline double current_time() const {
      timeval current_time;
      gettimeofday(&current_time, NULL);
      return (double)(current_time.tv_sec - start_time_.tv_sec) +
        ((double)(current_time.tv_usec - start_time_.tv_usec))/1.0E6;
    }


  }; // end of timer

}

#endif
