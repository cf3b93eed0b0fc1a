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
 * Typed projections of the three upstream tables: the watch log
 * (engagement with duration), the content log (presence only) and the
 * item catalog. Only the columns the recommender needs are required.
 */

#ifndef VODREC_DEF_LOG_TABLES
#define VODREC_DEF_LOG_TABLES

#include <string>
#include <vector>

#include "vodrec_types.hpp"
#include "preprocessing/table_reader.hpp"

namespace vodrec {

    /* Upstream column names */
    static const char * COL_SUBSCRIBER   = "subsr_id";
    static const char * COL_ITEM         = "program_id";
    static const char * COL_ITEM_NAME    = "program_name";
    static const char * COL_EPISODE      = "episode_num";
    static const char * COL_LOG_DATE     = "log_dt";
    static const char * COL_WATCHED      = "use_tms";
    static const char * COL_RUNTIME      = "disp_rtm_sec";
    static const char * COL_WATCH_COUNT  = "count_watch";
    static const char * COL_DELETED      = "e_bool";
    static const char * COL_ITEM_TYPE    = "ct_cl";
    static const char * COL_GENRE        = "program_genre";
    static const char * COL_RELEASE_DATE = "release_date";
    static const char * COL_AGE_LIMIT    = "age_limit";

    /* Index of an optional column, or -1 */
    static int optional_column(const raw_table & table, const std::string & column) {
        for (size_t i = 0; i < table.columns.size(); i++)
            if (table.columns[i] == column) return (int)i;
        return -1;
    }

    static std::string optional_string(const raw_table & table, size_t row, int col) {
        return col < 0 ? std::string() : table.rows[row][col];
    }

    /**
     * Soft-delete marker of a row. Deleted rows are not projected any
     * further, so their other fields may be empty or malformed.
     */
    static bool is_deleted(const raw_table & table, size_t row, size_t c_deleted) {
        return parse_long_field(table, row, c_deleted) != 0;
    }

    static std::vector<watch_event> load_watch_events(const raw_table & table) {
        size_t c_sub     = column_index(table, COL_SUBSCRIBER);
        size_t c_item    = column_index(table, COL_ITEM);
        size_t c_watched = column_index(table, COL_WATCHED);
        size_t c_runtime = column_index(table, COL_RUNTIME);
        size_t c_deleted = column_index(table, COL_DELETED);
        int c_name    = optional_column(table, COL_ITEM_NAME);
        int c_episode = optional_column(table, COL_EPISODE);
        int c_date    = optional_column(table, COL_LOG_DATE);
        int c_count   = optional_column(table, COL_WATCH_COUNT);

        std::vector<watch_event> events;
        events.reserve(table.size());
        for (size_t r = 0; r < table.size(); r++) {
            watch_event e;
            e.deleted = is_deleted(table, r, c_deleted);
            if (e.deleted) {
                events.push_back(e);
                continue;
            }
            e.subscriber      = parse_long_field(table, r, c_sub);
            e.item            = parse_long_field(table, r, c_item);
            e.watched_seconds = parse_double_field(table, r, c_watched);
            e.runtime_seconds = parse_double_field(table, r, c_runtime);
            e.item_name       = optional_string(table, r, c_name);
            e.log_date        = optional_string(table, r, c_date);
            if (c_episode >= 0) e.episode_num = (int)parse_long_field(table, r, c_episode, false);
            if (c_count >= 0)   e.watch_count = (int)parse_long_field(table, r, c_count, false);
            events.push_back(e);
        }
        return events;
    }

    static std::vector<content_event> load_content_events(const raw_table & table) {
        size_t c_sub     = column_index(table, COL_SUBSCRIBER);
        size_t c_item    = column_index(table, COL_ITEM);
        size_t c_deleted = column_index(table, COL_DELETED);
        int c_name    = optional_column(table, COL_ITEM_NAME);
        int c_episode = optional_column(table, COL_EPISODE);
        int c_date    = optional_column(table, COL_LOG_DATE);

        std::vector<content_event> events;
        events.reserve(table.size());
        for (size_t r = 0; r < table.size(); r++) {
            content_event e;
            e.deleted = is_deleted(table, r, c_deleted);
            if (e.deleted) {
                events.push_back(e);
                continue;
            }
            e.subscriber = parse_long_field(table, r, c_sub);
            e.item       = parse_long_field(table, r, c_item);
            e.item_name  = optional_string(table, r, c_name);
            e.log_date   = optional_string(table, r, c_date);
            if (c_episode >= 0) e.episode_num = (int)parse_long_field(table, r, c_episode, false);
            events.push_back(e);
        }
        return events;
    }

    static std::vector<item_info> load_item_catalog(const raw_table & table) {
        size_t c_item    = column_index(table, COL_ITEM);
        size_t c_deleted = column_index(table, COL_DELETED);
        int c_name    = optional_column(table, COL_ITEM_NAME);
        int c_type    = optional_column(table, COL_ITEM_TYPE);
        int c_genre   = optional_column(table, COL_GENRE);
        int c_release = optional_column(table, COL_RELEASE_DATE);
        int c_age     = optional_column(table, COL_AGE_LIMIT);

        std::vector<item_info> items;
        items.reserve(table.size());
        for (size_t r = 0; r < table.size(); r++) {
            item_info info;
            info.deleted = is_deleted(table, r, c_deleted);
            if (info.deleted) {
                items.push_back(info);
                continue;
            }
            info.item         = parse_long_field(table, r, c_item);
            info.name         = optional_string(table, r, c_name);
            info.type         = optional_string(table, r, c_type);
            info.genre        = optional_string(table, r, c_genre);
            info.release_date = optional_string(table, r, c_release);
            if (c_age >= 0) info.age_limit = (int)parse_long_field(table, r, c_age, false);
            items.push_back(info);
        }
        return items;
    }

}

#endif
