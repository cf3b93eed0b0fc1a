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
 * Smoketest for reading the upstream table dumps and projecting them to typed log events.
 */

#include <cstdio>
#include <string>
#include <vector>
#include <cassert>

#include "vodrec_basic_includes.hpp"

using namespace vodrec;

static std::string write_file(const std::string & filename, const std::string & contents) {
    FILE * f = fopen(filename.c_str(), "w");
    assert(f != NULL);
    fputs(contents.c_str(), f);
    fclose(f);
    return filename;
}

void test_split_fields() {
    std::vector<std::string> f = split_fields("1,\"Hello, World\",\"say \"\"hi\"\"\",", ',');
    assert(f.size() == 4);
    assert(f[0] == "1");
    assert(f[1] == "Hello, World");
    assert(f[2] == "say \"hi\"");
    assert(f[3] == "");

    f = split_fields("a\tb", '\t');
    assert(f.size() == 2 && f[1] == "b");
}

void test_watch_log() {
    std::string fn = write_file("vodrec_test_watch.csv",
        "subsr_id,program_id,program_name,episode_num,log_dt,use_tms,disp_rtm_sec,count_watch,e_bool\r\n"
        "1,10,\"News, Live\",3,2023-01-02,30,60,1,0\r\n"
        "2,11,Drama,,2023-01-03,45.5,90,2,1\r\n"
        "\r\n");
    raw_table table = read_table(fn, "watch_log");
    assert(table.size() == 2);
    assert(table.lines[0] == 2);

    std::vector<watch_event> events = load_watch_events(table);
    assert(events.size() == 2);
    assert(events[0].subscriber == 1 && events[0].item == 10);
    assert(events[0].item_name == "News, Live");
    assert(events[0].episode_num == 3);
    assert(events[0].watched_seconds == 30 && events[0].runtime_seconds == 60);
    assert(!events[0].deleted);
    assert(events[1].deleted);
    remove(fn.c_str());
}

void test_deleted_rows_not_parsed() {
    std::string fn = write_file("vodrec_test_watch_deleted.csv",
        "subsr_id,program_id,use_tms,disp_rtm_sec,e_bool\n"
        "1,10,30,60,0\n"
        "1,11,,,1\n"
        "x,y,abc,,1\n"
        "2,12,10,40,0\n");
    std::vector<watch_event> events = load_watch_events(read_table(fn, "watch_log"));
    assert(events.size() == 4);
    assert(events[1].deleted && events[2].deleted);
    assert(events[3].item == 12 && events[3].runtime_seconds == 40);

    interaction_set out = extract_interactions(events, std::vector<content_event>());
    assert(out.size() == 2);
    assert(out[0].item == 10 && out[0].rating == 0.5);
    assert(out[1].item == 12 && out[1].rating == 0.25);

    write_file(fn,
        "subsr_id,program_id,e_bool\n"
        "1,,1\n"
        "1,13,0\n");
    std::vector<content_event> content = load_content_events(read_table(fn, "content_log"));
    assert(content.size() == 2 && content[0].deleted && content[1].item == 13);

    write_file(fn,
        "program_id,program_name,age_limit,e_bool\n"
        ",Gone,n/a,1\n"
        "14,Kept,12,0\n");
    std::vector<item_info> items = load_item_catalog(read_table(fn, "item_info"));
    std::map<item_t, item_info> catalog = extract_item_catalog(items);
    assert(catalog.size() == 1 && catalog[14].name == "Kept");

    /* the flag itself is still required */
    write_file(fn, "subsr_id,program_id,e_bool\n1,10,\n");
    bool thrown = false;
    try {
        load_content_events(read_table(fn, "content_log"));
    } catch (const malformed_row_error & e) {
        thrown = true;
    }
    assert(thrown);
    remove(fn.c_str());
}

void test_missing_column() {
    std::string fn = write_file("vodrec_test_watch_nort.csv",
        "subsr_id,program_id,use_tms,e_bool\n"
        "1,10,30,0\n");
    raw_table table = read_table(fn, "watch_log");
    bool thrown = false;
    try {
        load_watch_events(table);
    } catch (const missing_column_error & e) {
        thrown = true;
        assert(e.table_name() == "watch_log");
        assert(e.column_name() == "disp_rtm_sec");
    }
    assert(thrown);

    /* the content log does not need duration fields */
    raw_table content("content_log");
    content.columns = table.columns;
    content.add_row(table.rows[0]);
    std::vector<content_event> events = load_content_events(content);
    assert(events.size() == 1 && events[0].item == 10);
    remove(fn.c_str());
}

void test_malformed_rows() {
    std::string fn = write_file("vodrec_test_bad.csv",
        "subsr_id,program_id,e_bool\n"
        "1,10,0\n"
        "2,11\n");
    bool thrown = false;
    try {
        read_table(fn, "content_log");
    } catch (const malformed_row_error & e) {
        thrown = true;
    }
    assert(thrown);

    write_file(fn, "subsr_id,program_id,e_bool\n1,ten,0\n");
    raw_table table = read_table(fn, "content_log");
    thrown = false;
    try {
        load_content_events(table);
    } catch (const malformed_row_error & e) {
        thrown = true;
    }
    assert(thrown);

    write_file(fn, "");
    thrown = false;
    try {
        read_table(fn, "content_log");
    } catch (const malformed_row_error & e) {
        thrown = true;
    }
    assert(thrown);
    remove(fn.c_str());

    thrown = false;
    try {
        read_table("vodrec_test_does_not_exist.csv", "item_info");
    } catch (const data_error & e) {
        thrown = true;
    }
    assert(thrown);
}

void test_item_catalog() {
    std::string fn = write_file("vodrec_test_items.tsv",
        "program_id\tprogram_name\tct_cl\tprogram_genre\trelease_date\tage_limit\te_bool\n"
        "10\tNews\tTV\tnews\t2020-01-01\t0\t0\n"
        "11\tHorror\tMovie\thorror\t2019-05-05\t19\t0\n"
        "12\tOld\tMovie\tdrama\t1999-01-01\t12\t1\n");
    std::vector<item_info> items = load_item_catalog(read_table(fn, "item_info", '\t'));
    assert(items.size() == 3);
    assert(items[1].name == "Horror" && items[1].age_limit == 19 && items[1].genre == "horror");
    assert(items[2].deleted);
    std::map<item_t, item_info> catalog = extract_item_catalog(items);
    assert(catalog.size() == 2);
    remove(fn.c_str());
}

void test_tables_to_interactions() {
    std::string wfn = write_file("vodrec_test_w.csv",
        "subsr_id,program_id,use_tms,disp_rtm_sec,e_bool\n"
        "1,10,30,60,0\n"
        "1,10,45,60,0\n"
        "2,10,0,0,1\n");
    std::string cfn = write_file("vodrec_test_c.csv",
        "subsr_id,program_id,e_bool\n"
        "1,10,0\n"
        "2,12,0\n");
    interaction_set out = extract_interactions(load_watch_events(read_table(wfn, "watch_log")),
                                               load_content_events(read_table(cfn, "content_log")));
    assert(out.size() == 2);
    assert(out[0].rated && out[0].rating == 0.75);
    assert(out[1].subscriber == 2 && !out[1].rated);
    remove(wfn.c_str());
    remove(cfn.c_str());
}

int main(int argc, const char ** argv) {
    test_split_fields();
    test_watch_log();
    test_deleted_rows_not_parsed();
    test_missing_column();
    test_malformed_rows();
    test_item_catalog();
    test_tables_to_interactions();

    logstream(LOG_INFO) << "Table reader smoketest passed successfully!" << std::endl;
    return 0;
}
