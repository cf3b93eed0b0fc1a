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
 * Builds the interaction set from the raw logs.
 *
 * The implicit rating of a (subscriber, item) pair is the largest
 * watched / runtime ratio over the subscriber's sessions of that item,
 * clipped to the rating range. Pairs are the union of both logs in order
 * of first appearance (watch log first). Pairs seen only in the content log
 * carry no rating.
 */

#ifndef VODREC_DEF_EXTRACTOR
#define VODREC_DEF_EXTRACTOR

#include <cmath>
#include <map>
#include <set>
#include <vector>
#include <sstream>
#include <utility>
#include <algorithm>

#include "vodrec_types.hpp"
#include "api/errors.hpp"
#include "logger/logger.hpp"

namespace vodrec {

    typedef std::pair<subscriber_t, item_t> user_item_pair;

    /**
     * Computes the implicit rating of every pair in the non-deleted watch
     * events. Throws invalid_runtime when a contributing event has a
     * displayed runtime <= 0 or not finite, and data_error when its watched
     * time is not finite.
     */
    static std::map<user_item_pair, double> compute_watch_ratios(const std::vector<watch_event> & events,
                                                                 double minval = 0, double maxval = 1) {
        std::map<user_item_pair, double> ratios;
        for (size_t i = 0; i < events.size(); i++) {
            const watch_event & e = events[i];
            if (e.deleted)
                continue;
            if (!(e.runtime_seconds > 0) || !std::isfinite(e.runtime_seconds)) {
                std::ostringstream msg;
                msg << "watch event " << i << " (subscriber " << e.subscriber << ", item " << e.item
                    << ") has display runtime " << e.runtime_seconds;
                logstream(LOG_ERROR) << msg.str() << std::endl;
                throw invalid_runtime(msg.str());
            }
            if (!std::isfinite(e.watched_seconds)) {
                std::ostringstream msg;
                msg << "watch event " << i << " (subscriber " << e.subscriber << ", item " << e.item
                    << ") has watched time " << e.watched_seconds;
                logstream(LOG_ERROR) << msg.str() << std::endl;
                throw data_error(msg.str());
            }
            double ratio = e.watched_seconds / e.runtime_seconds;
            ratio = std::min(ratio, maxval);
            ratio = std::max(ratio, minval);

            user_item_pair key(e.subscriber, e.item);
            std::map<user_item_pair, double>::iterator it = ratios.find(key);
            if (it == ratios.end())
                ratios[key] = ratio;
            else if (ratio > it->second)
                it->second = ratio;
        }
        return ratios;
    }

    /**
     * Union of both logs deduplicated on (subscriber, item), with the watch
     * ratio joined back in. Soft-deleted rows of either log are ignored.
     */
    static interaction_set extract_interactions(const std::vector<watch_event> & watch_log,
                                                const std::vector<content_event> & content_log,
                                                double minval = 0, double maxval = 1) {
        logstream(LOG_INFO) << "Extracting interactions from " << watch_log.size() << " watch events and "
                            << content_log.size() << " content events" << std::endl;

        std::map<user_item_pair, double> ratios = compute_watch_ratios(watch_log, minval, maxval);

        interaction_set out;
        std::set<user_item_pair> seen;
        size_t dropped = 0;

        for (size_t i = 0; i < watch_log.size(); i++) {
            if (watch_log[i].deleted) { dropped++; continue; }
            user_item_pair key(watch_log[i].subscriber, watch_log[i].item);
            if (!seen.insert(key).second)
                continue;
            out.push_back(interaction(key.first, key.second, ratios[key]));
        }
        for (size_t i = 0; i < content_log.size(); i++) {
            if (content_log[i].deleted) { dropped++; continue; }
            user_item_pair key(content_log[i].subscriber, content_log[i].item);
            if (!seen.insert(key).second)
                continue;
            std::map<user_item_pair, double>::const_iterator it = ratios.find(key);
            if (it != ratios.end())
                out.push_back(interaction(key.first, key.second, it->second));
            else
                out.push_back(interaction(key.first, key.second));
        }

        logstream(LOG_INFO) << "Extracted " << out.size() << " interactions (" << ratios.size()
                            << " rated), dropped " << dropped << " soft-deleted rows" << std::endl;
        return out;
    }

    static size_t count_rated(const interaction_set & interactions) {
        size_t n = 0;
        for (size_t i = 0; i < interactions.size(); i++)
            if (interactions[i].rated) n++;
        return n;
    }

    /**
     * Live items indexed by id. The first non-deleted row of an id wins.
     */
    static std::map<item_t, item_info> extract_item_catalog(const std::vector<item_info> & items) {
        std::map<item_t, item_info> catalog;
        for (size_t i = 0; i < items.size(); i++) {
            if (items[i].deleted)
                continue;
            if (catalog.find(items[i].item) == catalog.end())
                catalog[items[i].item] = items[i];
        }
        logstream(LOG_INFO) << "Item catalog has " << catalog.size() << " live titles" << std::endl;
        return catalog;
    }

}

#endif
