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
 * Simple metrics reporter that dumps metrics to
 * standard output.
 */


#ifndef VODREC_BASIC_REPORTER
#define VODREC_BASIC_REPORTER

#include <iostream>
#include <string>

#include "metrics/metrics.hpp"

namespace vodrec {

  /**
   * Prints counts, then results, then stage timings, then series.
   */
  class basic_reporter : public imetrics_reporter {

    static void print_section(const char * title, metrictype type, metrics_snapshot & entries) {
      bool header = false;
      for (metrics_snapshot::iterator it = entries.begin(); it != entries.end(); ++it) {
        const metrics_entry & ent = it->second;
        if (ent.valtype != type) continue;
        if (!header) {
          std::cout << "[" << title << "]" << std::endl;
          header = true;
        }
        std::cout << "  " << it->first << ": ";
        switch (type) {
          case STRING:
            std::cout << ent.stringval;
            break;
          case TIME:
            std::cout << ent.value << " s";
            break;
          case VECTOR:
            for (size_t j = 0; j < ent.series.size(); j++)
              std::cout << (j == 0 ? "" : " ") << ent.series[j];
            break;
          default:
            std::cout << ent.value;
        }
        std::cout << std::endl;
      }
    }

  public:
    virtual ~basic_reporter() {}

    virtual void do_report(std::string name, metrics_snapshot & entries) {
      std::cout << std::endl << "=== " << name << " run report ===" << std::endl;
      print_section("Counts", INTEGER, entries);
      print_section("Results", REAL, entries);
      print_section("Stage timings", TIME, entries);
      print_section("Per-epoch", VECTOR, entries);
      print_section("Other", STRING, entries);
    }

  };

}

#endif
