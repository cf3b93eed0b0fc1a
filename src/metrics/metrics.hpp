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
 * Metrics of one pipeline run: row counts, stage timings, scalar results
 * and the per-epoch training series. Reporters receive a snapshot.
 */


#ifndef VODREC_METRICS_HPP
#define VODREC_METRICS_HPP

#include <string>
#include <map>
#include <vector>
#include <utility>
#include <iostream>
#include <sys/time.h>

#include "util/pthread_tools.hpp"

namespace vodrec {


  enum metrictype {REAL, INTEGER, TIME, STRING, VECTOR};

  struct metrics_entry {
    metrictype valtype;
    double value;             // last value, or accumulated seconds for TIME
    size_t count;
    std::string stringval;
    std::vector<double> series;
    timeval start_time;
    double lasttime;

    metrics_entry() : valtype(REAL), value(0), count(0), lasttime(0) {}
    metrics_entry(metrictype _valtype, double x) : valtype(_valtype), value(x), count(1), lasttime(0) {}
    explicit metrics_entry(const std::string & s) : valtype(STRING), value(0), count(1), stringval(s), lasttime(0) {}

    void timer_start() {
      gettimeofday(&start_time, NULL);
    }

    /* Seconds since timer_start() */
    double elapsed() const {
      timeval end;
      gettimeofday(&end, NULL);
      return end.tv_sec - start_time.tv_sec + ((double)(end.tv_usec - start_time.tv_usec)) / 1.0E6;
    }
  };

  typedef std::map<std::string, metrics_entry> metrics_snapshot;

  class imetrics_reporter {
  public:
    virtual ~imetrics_reporter() {}
    virtual void do_report(std::string name, metrics_snapshot & entries) = 0;
  };

  class metrics {

    std::string name;
    metrics_snapshot entries;
    mutex mlock;

  public:
    explicit metrics(std::string _name) : name(_name) {
      set("app", _name);
    }

    inline void set(std::string key, size_t value) {
      set(key, (double)value, INTEGER);
    }

    inline void set(std::string key, int value) {
      set(key, (double)value, INTEGER);
    }

    inline void set(std::string key, double value, metrictype type = REAL) {
      scoped_lock lock(mlock);
      entries[key] = metrics_entry(type, value);
    }

    inline void set(std::string key, std::string s) {
      scoped_lock lock(mlock);
      entries[key] = metrics_entry(s);
    }

    /** Appends to a series, e.g. one value per epoch. */
    inline void add_to_vector(std::string key, double value) {
      scoped_lock lock(mlock);
      metrics_snapshot::iterator it = entries.find(key);
      if (it == entries.end()) {
        it = entries.insert(std::make_pair(key, metrics_entry(VECTOR, value))).first;
      } else {
        it->second.value = value;
        it->second.count++;
      }
      it->second.series.push_back(value);
    }

    metrics_entry start_time() {
      metrics_entry me(TIME, 0);
      me.timer_start();
      return me;
    }

    /** Adds the time elapsed since start_time() to the stage key. */
    inline void stop_time(metrics_entry me, std::string key, bool show = false) {
      me.lasttime = me.elapsed();
      scoped_lock lock(mlock);
      metrics_snapshot::iterator it = entries.find(key);
      if (it == entries.end()) {
        entries[key] = metrics_entry(TIME, me.lasttime);
      } else {
        it->second.value += me.lasttime;
        it->second.count++;
      }
      if (show)
        std::cout << key << ": " << me.lasttime << " secs." << std::endl;
    }

    void report(imetrics_reporter & reporter) {
      metrics_snapshot snapshot;
      {
        scoped_lock lock(mlock);
        snapshot = entries;
      }
      reporter.do_report(name, snapshot);
    }

  };

}

#endif
