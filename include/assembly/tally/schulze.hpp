//---------------------------------------------------------------------------//
// Copyright (c) 2022 The assembly_tally Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//---------------------------------------------------------------------------//

#ifndef ASSEMBLY_TALLY_SCHULZE_HPP
#define ASSEMBLY_TALLY_SCHULZE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <boost/assert.hpp>

#include <assembly/tally/pairwise.hpp>
#include <assembly/tally/preference.hpp>

namespace assembly {
    namespace tally {
        namespace strategy {

            /*!
             * @brief Winning votes link strength.
             *
             * A won link is stronger the more voters support it; equal
             * support is decided by smaller opposition. Ties give 0 and lost
             * links -1, so a lost link never beats a tied one.
             */
            struct winning_votes {
                std::int64_t operator()(std::size_t support, std::size_t opposition, std::size_t total) const {
                    if (support > opposition) {
                        return static_cast<std::int64_t>(total) * static_cast<std::int64_t>(support) -
                               static_cast<std::int64_t>(opposition);
                    }
                    if (support == opposition) {
                        return 0;
                    }
                    return -1;
                }
            };

            /// Support of a won link, 0 for tied and lost links.
            struct support {
                std::int64_t operator()(std::size_t pro, std::size_t contra, std::size_t) const {
                    return pro > contra ? static_cast<std::int64_t>(pro) : 0;
                }
            };

            struct margin {
                std::int64_t operator()(std::size_t support, std::size_t opposition, std::size_t) const {
                    return static_cast<std::int64_t>(support) - static_cast<std::int64_t>(opposition);
                }
            };

        }    // namespace strategy

        /// Row-major link strengths between all pairs of vote positions.
        struct link_matrix {
            std::size_t size;
            std::vector<std::int64_t> strength;

            std::int64_t operator()(std::size_t a, std::size_t b) const {
                return strength[a * size + b];
            }
        };

        template<typename StrengthStrategy = strategy::winning_votes>
        link_matrix link_strengths(const pairwise_matrix &d, StrengthStrategy strength = StrengthStrategy()) {
            link_matrix links {d.size(), std::vector<std::int64_t>(d.size() * d.size(), 0)};
            for (std::size_t a = 0; a < d.size(); ++a) {
                for (std::size_t b = 0; b < d.size(); ++b) {
                    if (a != b) {
                        links.strength[a * d.size() + b] = strength(d(a, b), d(b, a), d.vote_count());
                    }
                }
            }
            return links;
        }

        /*!
         * @brief Strongest path strengths among a subset of vote positions.
         *
         * Result is indexed by positions inside subset, not by candidate
         * index.
         */
        inline link_matrix strongest_paths(const link_matrix &links, const std::vector<std::size_t> &subset) {
            const std::size_t m = subset.size();
            link_matrix p {m, std::vector<std::int64_t>(m * m, 0)};
            for (std::size_t x = 0; x < m; ++x) {
                for (std::size_t y = 0; y < m; ++y) {
                    p.strength[x * m + y] = links(subset[x], subset[y]);
                }
            }
            for (std::size_t k = 0; k < m; ++k) {
                for (std::size_t i = 0; i < m; ++i) {
                    if (i == k) {
                        continue;
                    }
                    for (std::size_t j = 0; j < m; ++j) {
                        if (j == i || j == k) {
                            continue;
                        }
                        std::int64_t via = std::min(p.strength[i * m + k], p.strength[k * m + j]);
                        if (via > p.strength[i * m + j]) {
                            p.strength[i * m + j] = via;
                        }
                    }
                }
            }
            return p;
        }

        /// Members of subset that no other member beats.
        inline std::vector<std::size_t> schulze_winners(const link_matrix &links,
                                                        const std::vector<std::size_t> &subset) {
            link_matrix p = strongest_paths(links, subset);
            std::vector<std::size_t> winners;
            for (std::size_t x = 0; x < subset.size(); ++x) {
                bool beaten = false;
                for (std::size_t y = 0; y < subset.size() && !beaten; ++y) {
                    beaten = p(y, x) > p(x, y);
                }
                if (!beaten) {
                    winners.push_back(subset[x]);
                }
            }
            return winners;
        }

        /*!
         * @brief Aggregates the pairwise counts into one preference partition.
         *
         * Levels are peeled off one at a time: the unbeaten candidates among
         * the remaining ones form the next level, then strongest paths are
         * recomputed over what is left. Genuine ties stay ties.
         */
        template<typename StrengthStrategy = strategy::winning_votes>
        preference_partition schulze_evaluate(const pairwise_matrix &d,
                                              StrengthStrategy strength = StrengthStrategy()) {
            const link_matrix links = link_strengths(d, strength);

            std::vector<std::size_t> remaining(d.size());
            for (std::size_t i = 0; i < remaining.size(); ++i) {
                remaining[i] = i;
            }

            std::vector<preference_partition::level_type> levels;
            while (!remaining.empty()) {
                std::vector<std::size_t> winners = schulze_winners(links, remaining);
                BOOST_ASSERT_MSG(!winners.empty(), "Schulze round without winner");
                remaining.erase(std::remove_if(remaining.begin(), remaining.end(),
                                               [&winners](std::size_t c) {
                                                   return std::find(winners.begin(), winners.end(), c) !=
                                                          winners.end();
                                               }),
                                remaining.end());
                levels.push_back(std::move(winners));
            }
            return preference_partition(std::move(levels));
        }

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_SCHULZE_HPP
