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
 * This header includes all the main headers needed for a vodrec
 * program.
 */


#ifndef VODREC_DEF_ALLBASIC_INCLUDES
#define VODREC_DEF_ALLBASIC_INCLUDES

#include <omp.h>
#include <sstream>
#include <cstring>
#include <vector>

#include "vodrec_types.hpp"

#include "api/errors.hpp"
#include "api/vodrec_filenames.hpp"

#include "logger/logger.hpp"

#include "metrics/metrics.hpp"
#include "metrics/reps/basic_reporter.hpp"
#include "metrics/reps/file_reporter.hpp"

#include "output/output.hpp"

#include "preprocessing/table_reader.hpp"
#include "preprocessing/log_tables.hpp"
#include "preprocessing/extractor.hpp"
#include "preprocessing/split.hpp"

#include "util/cmdopts.hpp"
#include "util/random.hpp"
#include "util/timer.hpp"


namespace vodrec {
        
    /**
      * Helper for metrics.
      */
    static VARIABLE_IS_NOT_USED void metrics_report(metrics &m);
    static VARIABLE_IS_NOT_USED void metrics_report(metrics &m) {
        std::string reporters = get_option_string("metrics.reporter", "console");
        std::vector<char> creps(reporters.begin(), reporters.end());
        creps.push_back('\0');
        const char * delims = ",";
        char * saveptr = NULL;
        char * t = strtok_r(&creps[0], delims, &saveptr);

        while(t != NULL) {            
            std::string repname(t);
            if (repname == "basic" || repname == "console") {
                basic_reporter rep;
                m.report(rep);
            } else if (repname == "file") {
                file_reporter rep(get_option_string("metrics.reporter.filename", "metrics.txt"));
                m.report(rep);
            } else {
                logstream(LOG_WARNING) << "Could not find metrics reporter with name [" << repname << "], ignoring." << std::endl;
            }
            t = strtok_r(NULL, delims, &saveptr);
        }
    }
    
};

#endif
