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
 * Smoketest for the interaction extractor: watch ratios, soft deletes, deduplication across the two logs and the runtime guard.
 */

#include <cmath>
#include <limits>
#include <vector>
#include <cassert>

#include "vodrec_basic_includes.hpp"

using namespace vodrec;

static watch_event make_watch(subscriber_t u, item_t i, double watched, double runtime, bool deleted = false) {
    watch_event e;
    e.subscriber = u;
    e.item = i;
    e.watched_seconds = watched;
    e.runtime_seconds = runtime;
    e.deleted = deleted;
    return e;
}

static content_event make_content(subscriber_t u, item_t i, bool deleted = false) {
    content_event e;
    e.subscriber = u;
    e.item = i;
    e.deleted = deleted;
    return e;
}

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-12;
}

void test_union_and_left_join() {
    std::vector<watch_event> watch;
    watch.push_back(make_watch(1, 10, 30, 60));
    watch.push_back(make_watch(1, 10, 50, 60));
    watch.push_back(make_watch(1, 11, 120, 60));      // re-watch, saturates
    watch.push_back(make_watch(2, 10, 10, 0, true));  // deleted, runtime not checked

    std::vector<content_event> content;
    content.push_back(make_content(1, 10));
    content.push_back(make_content(2, 12));
    content.push_back(make_content(3, 13, true));
    content.push_back(make_content(2, 12));

    interaction_set out = extract_interactions(watch, content);
    assert(out.size() == 3);

    assert(out[0].subscriber == 1 && out[0].item == 10);
    assert(out[0].rated && near(out[0].rating, 50.0 / 60.0));

    assert(out[1].subscriber == 1 && out[1].item == 11);
    assert(out[1].rated && near(out[1].rating, 1.0));

    assert(out[2].subscriber == 2 && out[2].item == 12);
    assert(!out[2].rated);

    assert(count_rated(out) == 2);
}

void test_ratings_in_range() {
    std::vector<watch_event> watch;
    for (int k = 0; k < 20; k++)
        watch.push_back(make_watch(k % 4, k % 7, 17.0 * k, 45.0 + k));
    std::vector<content_event> content;
    interaction_set out = extract_interactions(watch, content);
    for (size_t k = 0; k < out.size(); k++) {
        assert(out[k].rated);
        assert(out[k].rating >= 0 && out[k].rating <= 1);
    }
}

void test_pairs_unique() {
    std::vector<watch_event> watch;
    watch.push_back(make_watch(5, 1, 10, 100));
    watch.push_back(make_watch(5, 1, 20, 100));
    std::vector<content_event> content;
    content.push_back(make_content(5, 1));
    content.push_back(make_content(5, 2));
    content.push_back(make_content(5, 2));
    interaction_set out = extract_interactions(watch, content);
    assert(out.size() == 2);
    assert(out[0].item == 1 && near(out[0].rating, 0.2));
    assert(out[1].item == 2 && !out[1].rated);
}

void test_zero_runtime_rejected() {
    std::vector<watch_event> watch;
    watch.push_back(make_watch(1, 10, 30, 60));
    watch.push_back(make_watch(1, 11, 30, 0));
    std::vector<content_event> content;

    bool thrown = false;
    try {
        extract_interactions(watch, content);
    } catch (const invalid_runtime & e) {
        thrown = true;
    }
    assert(thrown);

    /* also reachable as a generic data error */
    watch[1].runtime_seconds = -5;
    thrown = false;
    try {
        compute_watch_ratios(watch);
    } catch (const data_error & e) {
        thrown = true;
    }
    assert(thrown);
}

void test_non_finite_durations_rejected() {
    std::vector<content_event> content;
    std::vector<watch_event> watch;
    watch.push_back(make_watch(1, 10, std::numeric_limits<double>::quiet_NaN(), 100));
    bool thrown = false;
    try {
        extract_interactions(watch, content);
    } catch (const data_error & e) {
        thrown = true;
    }
    assert(thrown);

    watch[0] = make_watch(1, 10, std::numeric_limits<double>::infinity(), 100);
    thrown = false;
    try {
        extract_interactions(watch, content);
    } catch (const data_error & e) {
        thrown = true;
    }
    assert(thrown);

    watch[0] = make_watch(1, 10, 50, std::numeric_limits<double>::infinity());
    thrown = false;
    try {
        extract_interactions(watch, content);
    } catch (const invalid_runtime & e) {
        thrown = true;
    }
    assert(thrown);

    /* soft-deleted rows are dropped before any check */
    watch[0] = make_watch(1, 10, std::numeric_limits<double>::quiet_NaN(), 100, true);
    watch.push_back(make_watch(1, 11, 25, 100));
    interaction_set out = extract_interactions(watch, content);
    assert(out.size() == 1 && out[0].item == 11 && near(out[0].rating, 0.25));
}

void test_item_catalog() {
    std::vector<item_info> items(4);
    items[0].item = 1; items[0].name = "first";
    items[1].item = 1; items[1].name = "duplicate";
    items[2].item = 2; items[2].name = "gone"; items[2].deleted = true;
    items[3].item = 3; items[3].name = "third";

    std::map<item_t, item_info> catalog = extract_item_catalog(items);
    assert(catalog.size() == 2);
    assert(catalog[1].name == "first");
    assert(catalog.count(2) == 0);
    assert(catalog[3].name == "third");
}

int main(int argc, const char ** argv) {
    test_union_and_left_join();
    test_ratings_in_range();
    test_pairs_unique();
    test_zero_runtime_rejected();
    test_non_finite_durations_rejected();
    test_item_catalog();

    logstream(LOG_INFO) << "Extractor smoketest passed successfully!" << std::endl;
    return 0;
}
