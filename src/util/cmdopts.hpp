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
 * Command line options. Values are looked up first from the command
 * line (either "--key=value" or "key value"), then from the
 * configuration file, then the supplied default.
 */

#ifndef VODREC_CMDOPTS_DEF
#define VODREC_CMDOPTS_DEF


#include <string>
#include <cstring>
#include <cstdlib>
#include <map>
#include <iostream>
#include <stdint.h>

#include "api/errors.hpp"
#include "api/vodrec_filenames.hpp"
#include "util/configfile.hpp"

namespace vodrec {

    static bool _cmd_configured = false;

    static int _argc = 0;
    static char **_argv = NULL;
    static std::map<std::string, std::string> conf;


    static void VARIABLE_IS_NOT_USED set_conf(std::string key, std::string value) {
        conf[key] = value;
    }

    static void VARIABLE_IS_NOT_USED clear_conf() {
        conf.clear();
    }

    // Config file
    static std::string VARIABLE_IS_NOT_USED get_config_option_string(const char *option_name) {
        std::map<std::string, std::string>::iterator it = conf.find(option_name);
        if (it == conf.end()) {
            throw invalid_argument_error(std::string("missing required option: ") + option_name);
        }
        return it->second;
    }

    static std::string VARIABLE_IS_NOT_USED get_config_option_string(const char *option_name,
                                                                      std::string default_value) {
        std::map<std::string, std::string>::iterator it = conf.find(option_name);
        return it != conf.end() ? it->second : default_value;
    }

    static void set_argc(int argc, const char ** argv) {
        _argc = argc;
        _argv = (char**)argv;
        _cmd_configured = true;
        conf = loadconfig(filename_config(), filename_config_local());

        /* Load --key=value type arguments into the conf map */
        std::string prefix = "--";
        for (int i = 1; i < argc; i++) {
            std::string arg = std::string(_argv[i]);

            if (arg.substr(0, prefix.size()) == prefix) {
                arg = arg.substr(prefix.size());
                size_t a = arg.find_first_of("=", 0);
                if (a != arg.npos) {
                    std::string key = arg.substr(0, a);
                    std::string val = arg.substr(a + 1);

                    std::cout << "[" << key << "]" << " => " << "[" << val << "]" << std::endl;
                    conf[key] = val;
                }
            }
        }
    }

    static void VARIABLE_IS_NOT_USED vodrec_init(int argc, const char ** argv) {
        set_argc(argc, argv);
    }

    /* Looks for "option_name value" on the command line */
    static const char * find_cmdline_value(const char *option_name) {
        for (int i = _argc - 2; i >= 0; i -= 1)
            if (strcmp(_argv[i], option_name) == 0)
                return _argv[i + 1];
        return NULL;
    }

    static std::string VARIABLE_IS_NOT_USED get_option_string(const char *option_name,
                                                               std::string default_value) {
        const char * v = find_cmdline_value(option_name);
        if (v != NULL) return std::string(v);
        return get_config_option_string(option_name, default_value);
    }

    static std::string VARIABLE_IS_NOT_USED get_option_string(const char *option_name) {
        const char * v = find_cmdline_value(option_name);
        if (v != NULL) return std::string(v);
        return get_config_option_string(option_name);
    }

    static int VARIABLE_IS_NOT_USED get_option_int(const char *option_name, int default_value) {
        const char * v = find_cmdline_value(option_name);
        if (v != NULL) return atoi(v);
        std::map<std::string, std::string>::iterator it = conf.find(option_name);
        return it != conf.end() ? atoi(it->second.c_str()) : default_value;
    }

    static uint64_t VARIABLE_IS_NOT_USED get_option_long(const char *option_name, uint64_t default_value) {
        const char * v = find_cmdline_value(option_name);
        if (v != NULL) return strtoull(v, NULL, 10);
        std::map<std::string, std::string>::iterator it = conf.find(option_name);
        return it != conf.end() ? strtoull(it->second.c_str(), NULL, 10) : default_value;
    }

    static double VARIABLE_IS_NOT_USED get_option_float(const char *option_name, double default_value) {
        const char * v = find_cmdline_value(option_name);
        if (v != NULL) return atof(v);
        std::map<std::string, std::string>::iterator it = conf.find(option_name);
        return it != conf.end() ? atof(it->second.c_str()) : default_value;
    }

} // End namespace


#endif
