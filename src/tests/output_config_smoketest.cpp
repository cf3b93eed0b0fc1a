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
 * Smoketest for the recommendation JSON writer, configuration files, option lookup and the metrics file reporter.
 */

#include <cstdio>
#include <string>
#include <fstream>
#include <sstream>
#include <cassert>

#include "vodrec_basic_includes.hpp"

using namespace vodrec;

static std::string slurp(const std::string & filename) {
    std::ifstream f(filename.c_str());
    assert(f.is_open());
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void test_json_document() {
    recommendation_list list;
    list.push_back(recommendation(12, 0.93));
    list.push_back(recommendation(7, 0.5));
    list.push_back(recommendation(123456789012LL, 1.0 / 3.0));
    std::string doc = recommendations_to_json(list);
    assert(doc == "{\"columns\":[\"program_id\",\"pred_rating\"],\"index\":[0,1,2],"
                  "\"data\":[[12,0.93],[7,0.5],[123456789012,0.333333333333]]}");

    assert(recommendations_to_json(recommendation_list()) ==
           "{\"columns\":[\"program_id\",\"pred_rating\"],\"index\":[],\"data\":[]}");
}

void test_json_file_overwritten() {
    std::string fn = "vodrec_test_recommendation.json";
    recommendation_list list;
    list.push_back(recommendation(1, 0.25));
    list.push_back(recommendation(2, 0.125));
    write_recommendations_json(fn, list);

    recommendation_list shorter;
    shorter.push_back(recommendation(3, 0.75));
    write_recommendations_json(fn, shorter);
    assert(slurp(fn) == recommendations_to_json(shorter) + "\n");
    remove(fn.c_str());

    bool thrown = false;
    try {
        write_recommendations_json("no_such_directory/vodrec.json", list);
    } catch (const vodrec_error & e) {
        thrown = true;
    }
    assert(thrown);
}

void test_config_file() {
    std::string fn = "vodrec_test.cnf";
    std::string local = "vodrec_test.local.cnf";
    FILE * f = fopen(fn.c_str(), "w");
    assert(f != NULL);
    fputs("# comment\n% another\nD = 16\n  K=5  \nbroken line\nseed = 9\n", f);
    fclose(f);
    f = fopen(local.c_str(), "w");
    assert(f != NULL);
    fputs("K = 7\n", f);
    fclose(f);

    std::map<std::string, std::string> c = loadconfig(fn, local);
    assert(c.size() == 3);
    assert(c["D"] == "16");
    assert(c["K"] == "7");
    assert(c["seed"] == "9");

    std::map<std::string, std::string> missing = loadconfig("vodrec_test_missing.cnf", "vodrec_test_missing.local.cnf");
    assert(missing.empty());
    remove(fn.c_str());
    remove(local.c_str());
}

void test_options() {
    const char * argv[] = {"vodrec_test", "--D=8", "--biassgd_gamma=0.01", "K", "4"};
    vodrec_init(5, argv);
    set_conf("max_iter", "12");

    assert(get_option_int("D", 100) == 8);
    assert(get_option_float("biassgd_gamma", 0.005) == 0.01);
    assert(get_option_int("K", 10) == 4);
    assert(get_option_int("max_iter", 20) == 12);
    assert(get_option_long("seed", 0) == 0);
    assert(get_option_string("output", "recommendation.json") == "recommendation.json");

    bool thrown = false;
    try {
        get_option_string("watch_log");
    } catch (const invalid_argument_error & e) {
        thrown = true;
    }
    assert(thrown);
    clear_conf();
}

void test_metrics_file() {
    std::string fn = "vodrec_test_metrics.txt";
    metrics m("vodrec-test");
    m.set("users", (size_t)3);
    m.set("test_rmse", 0.5);
    m.add_to_vector("epoch_rmse", 0.75);
    m.add_to_vector("epoch_rmse", 0.5);
    metrics_entry me = m.start_time();
    m.stop_time(me, "fit");
    me = m.start_time();
    m.stop_time(me, "fit");
    {
        file_reporter rep(fn);
        m.report(rep);
    }
    basic_reporter console;
    m.report(console);
    std::string contents = slurp(fn);
    assert(contents.find("[vodrec-test]") != std::string::npos);
    assert(contents.find("vodrec-test.users=3") != std::string::npos);
    assert(contents.find("vodrec-test.epoch_rmse=0.750000,0.500000") != std::string::npos);
    assert(contents.find("vodrec-test.fit=") != std::string::npos);
    assert(contents.find("vodrec-test.test_rmse=0.500000") != std::string::npos);
    assert(contents.find("vodrec-test.app=vodrec-test") != std::string::npos);
    remove(fn.c_str());
}

int main(int argc, const char ** argv) {
    test_json_document();
    test_json_file_overwritten();
    test_config_file();
    test_options();
    test_metrics_file();

    logstream(LOG_INFO) << "Output and configuration smoketest passed successfully!" << std::endl;
    return 0;
}
