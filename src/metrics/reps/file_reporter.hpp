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
 * File metrics reporter. Writes name.key=value lines.
 */


#ifndef VODREC_FILE_REPORTER
#define VODREC_FILE_REPORTER

#include <cstdio>
#include <string>

#include "logger/logger.hpp"
#include "metrics/metrics.hpp"

namespace vodrec {

  class file_reporter : public imetrics_reporter {
  private:
    std::string filename;
    FILE * f;

    file_reporter(const file_reporter &);
    file_reporter & operator=(const file_reporter &);
  public:

    file_reporter(std::string fname) : filename(fname) {
      f = fopen(fname.c_str(), "w");
      if (f == NULL)
        logstream(LOG_ERROR) << "Could not open metrics file " << fname << ", metrics will not be written" << std::endl;
    }

    virtual ~file_reporter() {
      if (f != NULL) fclose(f);
    }

    virtual void do_report(std::string name, metrics_snapshot & entries) {
      if (f == NULL) return;
      fprintf(f, "[%s]\n", name.c_str());
      for (metrics_snapshot::iterator it = entries.begin(); it != entries.end(); ++it) {
        const metrics_entry & ent = it->second;
        switch(ent.valtype) {
          case INTEGER:
            fprintf(f, "%s.%s=%ld\n", name.c_str(), it->first.c_str(), (long int) (ent.value));
            break;
          case REAL:
          case TIME:
            fprintf(f, "%s.%s=%lf\n", name.c_str(), it->first.c_str(), ent.value);
            break;
          case STRING:
            fprintf(f, "%s.%s=%s\n", name.c_str(), it->first.c_str(), ent.stringval.c_str());
            break;
          case VECTOR:
            fprintf(f, "%s.%s=", name.c_str(), it->first.c_str());
            for (size_t j = 0; j < ent.series.size(); j++)
              fprintf(f, "%s%lf", (j == 0 ? "" : ","), ent.series[j]);
            fprintf(f, "\n");
            break;
        }
      }
      fflush(f);
    }

  };

}



#endif
