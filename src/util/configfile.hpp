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
 * Parses a simple key = value configuration file.
 */
#ifndef VODREC_CONFIGFILE_DEF
#define VODREC_CONFIGFILE_DEF

#include <cstdio>
#include <cstring>
#include <string>
#include <map>

#include "logger/logger.hpp"

namespace vodrec {

    static std::string trim(std::string str) {
        const std::string trimChars = " \f\n\r\t\v";
        std::string::size_type pos = str.find_last_not_of(trimChars);
        str.erase(pos + 1);
        pos = str.find_first_not_of(trimChars);
        str.erase(0, pos);
        return str;
    }

    /**
     * Reads key-values of a configuration file into conf. Existing keys
     * are overwritten. Lines starting with '#' or '%' are comments.
     * @return false if the file could not be opened.
     */
    static bool read_config_file(const std::string & filename, std::map<std::string, std::string> & conf) {
        FILE * f = fopen(filename.c_str(), "r");
        if (f == NULL) {
            return false;
        }

        char s[4096];
        while(fgets(s, 4096, f) != NULL) {
            std::string line = trim(s);
            if (line.empty() || line[0] == '#' || line[0] == '%') continue;

            std::string::size_type eq = line.find('=');
            if (eq == std::string::npos) {
                logstream(LOG_WARNING) << "Ignoring config line without '=' in " << filename
                                       << ": [" << line << "]" << std::endl;
                continue;
            }
            std::string key = trim(line.substr(0, eq));
            std::string val = trim(line.substr(eq + 1));
            if (key != "" && val != "")
                conf[key] = val;
        }
        fclose(f);
        return true;
    }

    /**
     * Returns the key-value map of a configuration file, with the
     * local file (if present) overriding the primary one.
     * A missing primary file only produces a warning; defaults then apply.
     * @param filename primary configuration file
     * @param local_filename local override file
     */
    static std::map<std::string, std::string> loadconfig(std::string filename, std::string local_filename) {
        std::map<std::string, std::string> conf;
        if (!read_config_file(filename, conf)) {
            logstream(LOG_WARNING) << "Could not read configuration file: " << filename
                                   << ", using defaults. Define VODREC_ROOT or run from the project directory." << std::endl;
        }
        if (read_config_file(local_filename, conf)) {
            logstream(LOG_INFO) << "Applied local configuration overrides from " << local_filename << std::endl;
        }
        return conf;
    }

}


#endif
