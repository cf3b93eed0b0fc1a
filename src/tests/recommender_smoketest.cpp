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
 * Smoketest for the recommender: rated items are excluded, short candidate sets are not padded, ordering and tie breaks are deterministic.
 */

#include <set>
#include <vector>
#include <cassert>

#include "vodrec_basic_includes.hpp"
#include "rating_matrix.hpp"
#include "biassgd.hpp"
#include "recommender.hpp"

using namespace vodrec;

static biassgd_params small_params() {
    biassgd_params p;
    p.D = 3;
    p.max_iter = 30;
    return p;
}

static void check_ordered(const recommendation_list & list) {
    for (size_t j = 1; j < list.size(); j++) {
        assert(list[j-1].score >= list[j].score);
        if (list[j-1].score == list[j].score)
            assert(list[j-1].item < list[j].item);
    }
}

void test_rated_items_excluded() {
    interaction_set train;
    train.push_back(interaction(1, 1, 0.9));
    train.push_back(interaction(1, 2, 0.2));
    train.push_back(interaction(2, 1, 0.5));
    train.push_back(interaction(1, 3));   // held out rating

    rating_matrix ratings = build_rating_matrix(train);
    assert(ratings.num_users() == 2 && ratings.num_items() == 3);
    assert(ratings.is_rated(1, 1) && ratings.is_rated(1, 2) && !ratings.is_rated(1, 3));
    std::vector<item_t> rated = ratings.rated_items(1);
    assert(rated.size() == 2 && rated[0] == 1 && rated[1] == 2);
    assert(ratings.rated_items(7).empty());
    assert(ratings.values(ratings.row_of(1), ratings.col_of(2)) == 0.2);
    assert(ratings.values(ratings.row_of(1), ratings.col_of(3)) == 0);

    biassgd_model model = fit_biassgd(train, small_params());
    recommendation_list top = recommend(model, ratings, 1, 2);
    assert(top.size() == 1);
    assert(top[0].item == 3);
}

void test_no_padding() {
    interaction_set train;
    train.push_back(interaction(1, 1, 0.9));
    train.push_back(interaction(2, 2, 0.4));
    train.push_back(interaction(2, 3, 0.6));
    train.push_back(interaction(3, 4, 0.3));
    rating_matrix ratings = build_rating_matrix(train);
    biassgd_model model = fit_biassgd(train, small_params());

    recommendation_list top = recommend(model, ratings, 1, 10);
    assert(top.size() == 3);
    std::set<item_t> got;
    for (size_t j = 0; j < top.size(); j++) got.insert(top[j].item);
    assert(got.count(1) == 0);
    assert(got.count(2) && got.count(3) && got.count(4));
    check_ordered(top);

    recommendation_list top2 = recommend(model, ratings, 1, 2);
    assert(top2.size() == 2);
    assert(top2[0].item == top[0].item && top2[1].item == top[1].item);
}

void test_unknown_user_gets_all_items() {
    interaction_set train;
    train.push_back(interaction(1, 5, 0.9));
    train.push_back(interaction(1, 2, 0.2));
    train.push_back(interaction(2, 7, 0.5));
    rating_matrix ratings = build_rating_matrix(train);
    assert(ratings.row_of(42) == -1);

    /* an unfitted model scores everything with the global mean */
    biassgd_model model;
    model.globalMean = 0.4;
    recommendation_list top = recommend(model, ratings, 42, 5);
    assert(top.size() == 3);
    assert(top[0].item == 2 && top[1].item == 5 && top[2].item == 7);
    for (size_t j = 0; j < top.size(); j++)
        assert(top[j].score == 0.4);
}

void test_everything_rated() {
    interaction_set train;
    train.push_back(interaction(1, 1, 0.9));
    train.push_back(interaction(1, 2, 0.2));
    train.push_back(interaction(2, 1, 0.5));
    rating_matrix ratings = build_rating_matrix(train);
    biassgd_model model = fit_biassgd(train, small_params());
    recommendation_list top = recommend(model, ratings, 1, 5);
    assert(top.empty());
}

void test_idempotent() {
    interaction_set train;
    for (int k = 0; k < 30; k++)
        train.push_back(interaction(k % 5, k % 9, (k % 10) / 10.0));
    train.push_back(interaction(0, 50));
    rating_matrix ratings = build_rating_matrix(train);
    biassgd_model model = fit_biassgd(train, small_params());

    for (subscriber_t u = 0; u < 5; u++) {
        recommendation_list a = recommend(model, ratings, u, 4);
        recommendation_list b = recommend(model, ratings, u, 4);
        assert(a.size() == b.size() && a.size() <= 4);
        for (size_t j = 0; j < a.size(); j++) {
            assert(a[j].item == b[j].item && a[j].score == b[j].score);
            assert(!ratings.is_rated(u, a[j].item));
        }
        check_ordered(a);
    }
}

void test_bad_k() {
    interaction_set train;
    train.push_back(interaction(1, 1, 0.9));
    rating_matrix ratings = build_rating_matrix(train);
    biassgd_model model;
    bool thrown = false;
    try {
        recommend(model, ratings, 1, 0);
    } catch (const invalid_argument_error & e) {
        thrown = true;
    }
    assert(thrown);
}

int main(int argc, const char ** argv) {
    test_rated_items_excluded();
    test_no_padding();
    test_unknown_user_gets_all_items();
    test_everything_rated();
    test_idempotent();
    test_bad_k();

    logstream(LOG_INFO) << "Recommender smoketest passed successfully!" << std::endl;
    return 0;
}
