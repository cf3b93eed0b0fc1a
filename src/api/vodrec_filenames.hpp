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
 * Standard filenames used by vodrec.
 * You can specify environment variable "VODREC_ROOT", which is the
 * root directory for the configuration files.
 */

#ifndef VODREC_FILENAMES_DEF
#define VODREC_FILENAMES_DEF

#include <string>
#include <stdlib.h>

namespace vodrec {

#ifdef __GNUC__
#define VARIABLE_IS_NOT_USED __attribute__ ((unused))
#else
#define VARIABLE_IS_NOT_USED
#endif

    static std::string VARIABLE_IS_NOT_USED root_relative(const std::string & path) {
        char * root = getenv("VODREC_ROOT");
        if (root != NULL) {
            return std::string(root) + "/" + path;
        }
        return path;
    }

    /**
     * Configuration file name.
     */
    static std::string VARIABLE_IS_NOT_USED filename_config() {
        return root_relative("conf/vodrec.cnf");
    }

    /**
     * Configuration file name - local version which can
     * override the version in the version control.
     */
    static std::string VARIABLE_IS_NOT_USED filename_config_local() {
        return root_relative("conf/vodrec.local.cnf");
    }

}

#endif
