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
 * Reads delimited text dumps of the upstream log tables. The first line
 * holds the column names. Fields may be wrapped in double quotes when they
 * contain the delimiter; a doubled quote inside a quoted field is a literal
 * quote.
 */

#ifndef VODREC_DEF_TABLE_READER
#define VODREC_DEF_TABLE_READER

#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include <stdint.h>
#include <string>
#include <vector>
#include <sstream>

#include "api/errors.hpp"
#include "logger/logger.hpp"

namespace vodrec {

    struct raw_table {
        std::string name;
        std::vector<std::string> columns;
        std::vector<std::vector<std::string> > rows;
        std::vector<size_t> lines;  // source line of each row, 1-based

        raw_table() {}
        explicit raw_table(const std::string & _name) : name(_name) {}

        size_t size() const { return rows.size(); }

        /** Appends a row; used when tables are built in memory. */
        void add_row(const std::vector<std::string> & row) {
            rows.push_back(row);
            lines.push_back(rows.size() + 1);
        }
    };

    /**
     * Position of column in the table header.
     * Throws missing_column_error if absent.
     */
    static size_t column_index(const raw_table & table, const std::string & column) {
        for (size_t i = 0; i < table.columns.size(); i++) {
            if (table.columns[i] == column) return i;
        }
        logstream(LOG_ERROR) << "Table [" << table.name << "] lacks required column [" << column << "]" << std::endl;
        throw missing_column_error(table.name, column);
    }

    static std::vector<std::string> split_fields(const std::string & line, char delimiter) {
        std::vector<std::string> fields;
        std::string cur;
        bool quoted = false;
        for (size_t i = 0; i < line.size(); i++) {
            char c = line[i];
            if (quoted) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i+1] == '"') {
                        cur += '"';
                        i++;
                    } else {
                        quoted = false;
                    }
                } else {
                    cur += c;
                }
            } else if (c == '"' && cur.empty()) {
                quoted = true;
            } else if (c == delimiter) {
                fields.push_back(cur);
                cur.clear();
            } else {
                cur += c;
            }
        }
        fields.push_back(cur);
        return fields;
    }

    static std::string strip_line_end(const char * linebuf) {
        std::string s(linebuf);
        while (!s.empty() && (s[s.size()-1] == '\n' || s[s.size()-1] == '\r'))
            s.erase(s.size()-1);
        return s;
    }

    /**
     * Reads a delimited text file with a header row.
     * @param filename input path
     * @param name table name used in error messages
     * @param delimiter field separator
     */
    static raw_table read_table(const std::string & filename, const std::string & name, char delimiter = ',') {
        FILE * f = fopen(filename.c_str(), "r");
        if (f == NULL) {
            logstream(LOG_ERROR) << "Failed to open table [" << name << "] file: " << filename << std::endl;
            throw data_error("cannot open " + filename + " for table " + name);
        }

        raw_table table(name);
        char * linebuf = NULL;
        size_t linesize = 0;
        size_t line = 0;
        bool have_header = false;
        while (true) {
            ssize_t rc = getline(&linebuf, &linesize, f);
            if (rc == -1)
                break;
            line++;
            std::string s = strip_line_end(linebuf);
            if (s.empty())
                continue;

            std::vector<std::string> fields = split_fields(s, delimiter);
            if (!have_header) {
                table.columns = fields;
                have_header = true;
                continue;
            }
            if (fields.size() != table.columns.size()) {
                free(linebuf);
                fclose(f);
                std::ostringstream msg;
                msg << "table [" << name << "] line " << line << " has " << fields.size()
                    << " fields, header has " << table.columns.size();
                logstream(LOG_ERROR) << msg.str() << std::endl;
                throw malformed_row_error(msg.str());
            }
            table.rows.push_back(fields);
            table.lines.push_back(line);
        }
        free(linebuf);
        fclose(f);

        if (!have_header) {
            logstream(LOG_ERROR) << "Table [" << name << "] file " << filename << " is empty" << std::endl;
            throw malformed_row_error("table [" + name + "] has no header line");
        }
        logstream(LOG_INFO) << "Read " << table.size() << " rows of table [" << name << "] from " << filename << std::endl;
        return table;
    }

    /* Field conversion. Empty optional fields yield the default. */

    static std::string field_error(const raw_table & table, size_t row, const std::string & column,
                                   const std::string & value) {
        std::ostringstream msg;
        msg << "table [" << table.name << "] line " << table.lines[row] << " column [" << column
            << "]: cannot parse [" << value << "]";
        return msg.str();
    }

    static int64_t parse_long_field(const raw_table & table, size_t row, size_t col,
                                    bool required = true, int64_t default_value = 0) {
        const std::string & v = table.rows[row][col];
        if (v.empty() && !required) return default_value;
        char * end = NULL;
        errno = 0;
        long long x = strtoll(v.c_str(), &end, 10);
        if (v.empty() || errno != 0 || *end != '\0') {
            std::string msg = field_error(table, row, table.columns[col], v);
            logstream(LOG_ERROR) << msg << std::endl;
            throw malformed_row_error(msg);
        }
        return (int64_t)x;
    }

    static double parse_double_field(const raw_table & table, size_t row, size_t col,
                                     bool required = true, double default_value = 0) {
        const std::string & v = table.rows[row][col];
        if (v.empty() && !required) return default_value;
        char * end = NULL;
        errno = 0;
        double x = strtod(v.c_str(), &end);
        if (v.empty() || errno != 0 || *end != '\0' || !std::isfinite(x)) {
            std::string msg = field_error(table, row, table.columns[col], v);
            logstream(LOG_ERROR) << msg << std::endl;
            throw malformed_row_error(msg);
        }
        return x;
    }

}

#endif
