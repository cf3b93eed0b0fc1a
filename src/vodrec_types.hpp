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
 * Basic types used throughout the recommender.
 */

#ifndef DEF_VODREC_TYPES
#define DEF_VODREC_TYPES

#include <string>
#include <vector>
#include <stdint.h>

namespace vodrec {

    typedef int64_t subscriber_t;
    typedef int64_t item_t;

    /**
     * One row of the engagement-with-duration log.
     */
    struct watch_event {
        subscriber_t subscriber;
        item_t item;
        std::string item_name;
        int episode_num;
        std::string log_date;
        double watched_seconds;
        double runtime_seconds;   // displayed runtime of the title
        int watch_count;
        bool deleted;             // soft-delete marker (e_bool)

        watch_event() : subscriber(0), item(0), episode_num(0), watched_seconds(0),
                        runtime_seconds(0), watch_count(0), deleted(false) {}
    };

    /**
     * One row of the presence-only content log.
     */
    struct content_event {
        subscriber_t subscriber;
        item_t item;
        std::string item_name;
        int episode_num;
        std::string log_date;
        bool deleted;

        content_event() : subscriber(0), item(0), episode_num(0), deleted(false) {}
    };

    struct item_info {
        item_t item;
        std::string name;
        std::string type;
        std::string genre;
        std::string release_date;
        int age_limit;
        bool deleted;

        item_info() : item(0), age_limit(0), deleted(false) {}
    };

    /**
     * A subscriber's engagement with a title. rated is false when the pair
     * only appears in the content log, or when its rating is held out.
     */
    struct interaction {
        subscriber_t subscriber;
        item_t item;
        double rating;
        bool rated;

        interaction() : subscriber(0), item(0), rating(0), rated(false) {}
        interaction(subscriber_t u, item_t i) : subscriber(u), item(i), rating(0), rated(false) {}
        interaction(subscriber_t u, item_t i, double r) : subscriber(u), item(i), rating(r), rated(true) {}
    };

    typedef std::vector<interaction> interaction_set;

    struct recommendation {
        item_t item;
        double score;
        recommendation() : item(0), score(0) {}
        recommendation(item_t i, double s) : item(i), score(s) {}
    };

    typedef std::vector<recommendation> recommendation_list;

}


#endif
