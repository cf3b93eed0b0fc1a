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
 * Output interface for recommendation lists, and the JSON writer that
 * produces the record document handed to the downstream store:
 *
 *   {"columns":["program_id","pred_rating"],"index":[0,1],"data":[[12,0.93],[7,0.88]]}
 *
 * index holds the rank of each row. The file is replaced on every run.
 */

#ifndef VODREC_DEF_OUTPUT_HPP
#define VODREC_DEF_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <sstream>
#include <fstream>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "logger/logger.hpp"

namespace vodrec {

    class irecommendation_output {
    public:
        virtual ~irecommendation_output() {}

        virtual void output_recommendations(const recommendation_list & list) = 0;

        // Called automatically at the end
        virtual void close() = 0;
    };

    inline std::string format_score(double score) {
        char buf[64];
        snprintf(buf, sizeof(buf), "%.12g", score);
        return std::string(buf);
    }

    /**
     * Serializes list as a split-oriented JSON table.
     */
    inline std::string recommendations_to_json(const recommendation_list & list) {
        std::ostringstream out;
        out << "{\"columns\":[\"program_id\",\"pred_rating\"],\"index\":[";
        for (size_t j = 0; j < list.size(); j++)
            out << (j == 0 ? "" : ",") << j;
        out << "],\"data\":[";
        for (size_t j = 0; j < list.size(); j++)
            out << (j == 0 ? "" : ",") << "[" << (long long)list[j].item << "," << format_score(list[j].score) << "]";
        out << "]}";
        return out.str();
    }

    class json_split_output : public irecommendation_output {

        std::string filename;
        std::ofstream strm;

        json_split_output(const json_split_output &);
        json_split_output & operator=(const json_split_output &);

    public:

        explicit json_split_output(std::string _filename) : filename(_filename) {
            strm.open(filename.c_str(), std::ofstream::out | std::ofstream::trunc);
            if (!strm.is_open()) {
                logstream(LOG_ERROR) << "Failed to open output file: " << filename << std::endl;
                throw vodrec_error("cannot open output file " + filename);
            }
        }

        ~json_split_output() {
            if (strm.is_open()) strm.close();
        }

        void output_recommendations(const recommendation_list & list) {
            strm << recommendations_to_json(list) << "\n";
            strm.flush();
            if (!strm.good()) {
                logstream(LOG_ERROR) << "Failed to write recommendations to " << filename << std::endl;
                throw vodrec_error("write failed on " + filename);
            }
            logstream(LOG_INFO) << "Wrote " << list.size() << " recommendations to " << filename << std::endl;
        }

        void close() {
            strm.close();
        }

    };

    /** Writes list to path as a split-oriented JSON table, replacing the file. */
    inline void write_recommendations_json(const std::string & path, const recommendation_list & list) {
        json_split_output out(path);
        out.output_recommendations(list);
        out.close();
    }

}


#endif
