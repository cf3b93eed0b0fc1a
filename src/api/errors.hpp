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
 * Exception types raised by the recommendation pipeline stages.
 * Data errors come from the extractor boundary, insufficient-data errors
 * from the split and evaluation stages. Model quality problems are never
 * thrown, see biassgd.hpp.
 */

#ifndef VODREC_DEF_ERRORS
#define VODREC_DEF_ERRORS

#include <stdexcept>
#include <string>

namespace vodrec {

    class vodrec_error : public std::runtime_error {
    public:
        explicit vodrec_error(const std::string & msg) : std::runtime_error(msg) {}
    };

    /** Raised by logstream(LOG_FATAL) once the message is flushed. */
    class fatal_error : public vodrec_error {
    public:
        explicit fatal_error(const std::string & msg) : vodrec_error(msg) {}
    };

    class invalid_argument_error : public vodrec_error {
    public:
        explicit invalid_argument_error(const std::string & msg) : vodrec_error(msg) {}
    };

    /* Malformed or inconsistent raw log data */
    class data_error : public vodrec_error {
    public:
        explicit data_error(const std::string & msg) : vodrec_error(msg) {}
    };

    class missing_column_error : public data_error {
        std::string table, column;
    public:
        missing_column_error(const std::string & _table, const std::string & _column) :
            data_error("table [" + _table + "] has no column [" + _column + "]"),
            table(_table), column(_column) {}
        virtual ~missing_column_error() throw() {}

        const std::string & table_name() const { return table; }
        const std::string & column_name() const { return column; }
    };

    class malformed_row_error : public data_error {
    public:
        explicit malformed_row_error(const std::string & msg) : data_error(msg) {}
    };

    /** Display runtime <= 0 on a watch event that feeds the watch ratio. */
    class invalid_runtime : public data_error {
    public:
        explicit invalid_runtime(const std::string & msg) : data_error(msg) {}
    };

    /* Too few rows to split, train or evaluate */
    class insufficient_data_error : public vodrec_error {
    public:
        explicit insufficient_data_error(const std::string & msg) : vodrec_error(msg) {}
    };

    class empty_dataset_error : public insufficient_data_error {
    public:
        explicit empty_dataset_error(const std::string & msg) : insufficient_data_error(msg) {}
    };

    class empty_test_set_error : public insufficient_data_error {
    public:
        explicit empty_test_set_error(const std::string & msg) : insufficient_data_error(msg) {}
    };

}

#endif
