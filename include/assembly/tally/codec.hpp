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

#ifndef ASSEMBLY_TALLY_CODEC_HPP
#define ASSEMBLY_TALLY_CODEC_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <assembly/tally/candidate_set.hpp>
#include <assembly/tally/preference.hpp>
#include <assembly/tally/status.hpp>

namespace assembly {
    namespace tally {

        /// Surface form of a classical (multi-select) vote.
        struct classical_selection {
            std::vector<std::string> selected;
            bool reject_all = false;
        };

        /// How to import classical votes recorded before the bar was stored with them.
        enum class legacy_policy { unresolvable, abstention, approval };

        /*!
         * @brief Parses a relation string like "C=D>A>B=E>J".
         *
         * Every vote position, the bar included, has to appear exactly once.
         * An empty string is an abstention.
         */
        inline vote_status parse_preferential(const std::string &raw, const candidate_set &candidates,
                                              preference_partition &out) {
            const std::string text = boost::algorithm::trim_copy(raw);
            if (text.empty()) {
                out = abstention(candidates);
                return vote_status::success;
            }

            std::vector<std::string> groups;
            boost::algorithm::split(groups, text, boost::algorithm::is_any_of(">"));

            std::vector<bool> seen(candidates.size(), false);
            std::vector<preference_partition::level_type> levels;
            levels.reserve(groups.size());
            for (const auto &group : groups) {
                std::vector<std::string> names;
                boost::algorithm::split(names, group, boost::algorithm::is_any_of("="));
                preference_partition::level_type level;
                for (auto name : names) {
                    boost::algorithm::trim(name);
                    if (name.empty()) {
                        return vote_status::empty_token;
                    }
                    auto idx = candidates.index_of(name);
                    if (!idx) {
                        return vote_status::unknown_candidate;
                    }
                    if (seen[*idx]) {
                        return vote_status::duplicate_candidate;
                    }
                    seen[*idx] = true;
                    level.push_back(*idx);
                }
                levels.push_back(std::move(level));
            }
            for (bool present : seen) {
                if (!present) {
                    return vote_status::incomplete_ranking;
                }
            }
            out = preference_partition(std::move(levels));
            return vote_status::success;
        }

        /*!
         * @brief Maps a classical selection onto the canonical form.
         *
         * Classical votes have at most two levels. With the bar enabled the
         * three corner cases are kept apart:
         *  - reject all:        _bar_ > everyone
         *  - everyone selected: everyone > _bar_
         *  - nothing selected:  everyone = _bar_
         * Any other selection ranks above the rest, the bar joins the rest.
         */
        inline vote_status encode_classical(const classical_selection &selection, const ballot_config &config,
                                            preference_partition &out) {
            if (config.mode != vote_mode::classical) {
                return vote_status::wrong_mode;
            }
            const candidate_set &candidates = config.candidates;
            const std::size_t total = candidates.candidate_count();

            std::vector<bool> chosen(total, false);
            std::size_t count = 0;
            for (const auto &name : selection.selected) {
                auto idx = candidates.index_of(name);
                if (!idx || candidates.is_bar(*idx)) {
                    return vote_status::unknown_candidate;
                }
                if (chosen[*idx]) {
                    return vote_status::duplicate_candidate;
                }
                chosen[*idx] = true;
                ++count;
            }

            preference_partition::level_type preferred;
            preference_partition::level_type rejected;
            for (std::size_t i = 0; i < total; ++i) {
                (chosen[i] ? preferred : rejected).push_back(i);
            }

            if (selection.reject_all) {
                if (!candidates.use_bar()) {
                    return vote_status::bar_unavailable;
                }
                if (count > 0) {
                    return vote_status::reject_conflict;
                }
                out = preference_partition({{candidates.bar_index()}, rejected});
                return vote_status::success;
            }

            // selecting everyone is only distinct from abstaining when the bar is there
            const bool everyone = candidates.use_bar() && count > 0 && count == total;
            if (count > config.votes && !everyone) {
                return vote_status::too_many_selections;
            }

            if (candidates.use_bar()) {
                if (everyone) {
                    out = preference_partition({preferred, {candidates.bar_index()}});
                    return vote_status::success;
                }
                if (count == 0) {
                    out = abstention(candidates);
                    return vote_status::success;
                }
                rejected.push_back(candidates.bar_index());
            }
            out = preference_partition({preferred, rejected});
            return vote_status::success;
        }

        /// Extra constraints a canonical classical vote string has to satisfy.
        inline vote_status validate_classical(const preference_partition &vote, const ballot_config &config) {
            if (vote.size() <= 1) {
                return vote_status::success;
            }
            if (vote.size() > 2) {
                return vote_status::too_many_levels;
            }
            const candidate_set &candidates = config.candidates;
            const auto &first = vote.levels().front();
            for (std::size_t idx : first) {
                if (candidates.is_bar(idx)) {
                    return first.size() == 1 ? vote_status::success : vote_status::misplaced_bar;
                }
            }
            const bool everyone = candidates.use_bar() && first.size() == candidates.candidate_count();
            if (first.size() > config.votes && !everyone) {
                return vote_status::too_many_selections;
            }
            return vote_status::success;
        }

        /// Decodes a vote string for either mode of the ballot.
        inline vote_status decode_vote(const std::string &raw, const ballot_config &config,
                                       preference_partition &out) {
            preference_partition vote;
            vote_status status = parse_preferential(raw, config.candidates, vote);
            if (status != vote_status::success) {
                return status;
            }
            if (config.mode == vote_mode::classical) {
                status = validate_classical(vote, config);
                if (status != vote_status::success) {
                    return status;
                }
            }
            out = std::move(vote);
            return vote_status::success;
        }

        /*!
         * @brief Imports a classical vote string that may lack the bar.
         *
         * Old classical votes were stored over the real candidates only, so
         * "everyone tied" cannot tell an abstention from approving everyone.
         * Two-level strings are unambiguous, the bar joins the lower level.
         * Single-level strings are resolved by the given policy only.
         */
        inline vote_status import_legacy_classical(const std::string &raw, const ballot_config &config,
                                                   legacy_policy policy, preference_partition &out) {
            if (config.mode != vote_mode::classical) {
                return vote_status::wrong_mode;
            }
            const candidate_set &candidates = config.candidates;
            if (!candidates.use_bar() || raw.find(bar_shortname) != std::string::npos) {
                return decode_vote(raw, config, out);
            }

            ballot_config legacy_config {candidate_set(candidates.candidates(), false), config.mode, config.votes};
            preference_partition legacy;
            vote_status status = decode_vote(raw, legacy_config, legacy);
            if (status != vote_status::success) {
                return status;
            }

            if (legacy.size() == 2) {
                auto lower = legacy.levels()[1];
                lower.push_back(candidates.bar_index());
                out = preference_partition({legacy.levels()[0], lower});
                return vote_status::success;
            }

            switch (policy) {
                case legacy_policy::abstention:
                    out = abstention(candidates);
                    return vote_status::success;
                case legacy_policy::approval:
                    out = preference_partition({legacy.levels()[0], {candidates.bar_index()}});
                    return vote_status::success;
                case legacy_policy::unresolvable:
                    break;
            }
            return vote_status::ambiguous_legacy_vote;
        }

    }    // namespace tally
}    // namespace assembly

#endif    // ASSEMBLY_TALLY_CODEC_HPP
